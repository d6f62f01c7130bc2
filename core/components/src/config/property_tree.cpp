#include <confix/core/config/property_tree.hpp>

namespace confix::core::config {

std::string path_to_string(const StepPath& path) {
    std::string out;
    for (const auto& step : path) {
        if (step.is_index()) {
            out += '[';
            out += std::to_string(step.position());
            out += ']';
            continue;
        }
        if (!out.empty()) {
            out += '.';
        }
        out += step.name();
    }
    return out;
}

StepPath to_step_path(const KeyPath& keys) {
    StepPath path;
    path.reserve(keys.size());
    for (const auto& key : keys) {
        path.push_back(PathStep::for_key(key));
    }
    return path;
}

template class BasicPropertyTree<std::string>;

}  // namespace confix::core::config
