#include <confix/core/config/descriptor.hpp>

#include <array>

namespace confix::core::config {

std::string_view node_name(const DescriptorNode& node) noexcept {
    static constexpr std::array<std::string_view, std::variant_size_v<DescriptorNode::Op>> names = {
        "Value", "Nested", "Zip", "OrElseEither", "Sequence",
        "Optional", "Default", "Transform", "Describe", "SourcedFrom"};

    const auto index = node.op.index();
    return index < names.size() ? names[index] : std::string_view("Unknown");
}

}  // namespace confix::core::config
