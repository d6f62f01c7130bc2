#pragma once

/**
 * @file descriptor.hpp
 * @brief Bidirectional configuration schema
 *
 * A ConfigDescriptor<T> is an immutable expression describing where a T lives
 * in a configuration tree. The same expression is interpreted by the Reader
 * (tree -> T) and by the Writer (T -> tree), so both directions always agree
 * on the schema.
 *
 * Example:
 * @code
 *   struct Database { std::string url; int32_t port; };
 *
 *   auto database = nested("database",
 *                          zip_all(string("url"), int32("port").default_value(5432)))
 *                       .to<Database>([](const Database& d) {
 *                           return std::make_tuple(d.url, d.port);
 *                       });
 * @endcode
 */

#include <confix/common/error.hpp>
#include <confix/core/config/config_source.hpp>
#include <confix/core/config/property_type.hpp>

#include <any>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace confix::core::config {

/// Sum of two alternatives; index 0 is the left side
template<typename A, typename B>
using Either = std::variant<A, B>;

// ============================================================================
// DESCRIPTOR NODES
// ============================================================================

struct DescriptorNode;
using NodePtr = std::shared_ptr<const DescriptorNode>;

/// Scalar at the named key, or at the current path when keyless
struct ValueNode {
    std::optional<std::string> key;
    PropertyTypeInfo type;
};

struct NestedNode {
    std::string key;
    NodePtr inner;
};

struct ZipNode {
    NodePtr left;
    NodePtr right;
    std::function<std::any(std::any, std::any)> combine;
    std::function<std::pair<std::any, std::any>(const std::any&)> split;
};

struct OrElseEitherNode {
    NodePtr left;
    NodePtr right;
    std::function<std::any(std::any)> make_left;
    std::function<std::any(std::any)> make_right;
    /// {true, left value} or {false, right value}
    std::function<std::pair<bool, std::any>(const std::any&)> select;
};

struct SequenceNode {
    NodePtr inner;
    std::function<std::any(std::vector<std::any>)> collect;
    std::function<std::vector<std::any>(const std::any&)> elements;
};

struct OptionalNode {
    NodePtr inner;
    std::function<std::any(std::optional<std::any>)> wrap;
    std::function<std::optional<std::any>(const std::any&)> unwrap;
};

struct DefaultNode {
    NodePtr inner;
    std::any fallback;
    /// Fallback as text, when the type has a string form
    std::optional<std::string> rendered;
};

struct TransformNode {
    NodePtr inner;
    std::function<common::Result<std::any>(const std::any&)> forward;
    std::function<common::Result<std::any>(const std::any&)> backward;
};

struct DescribeNode {
    NodePtr inner;
    std::string text;
};

struct SourcedFromNode {
    NodePtr inner;
    ConfigSource source;
};

struct DescriptorNode {
    using Op = std::variant<ValueNode, NestedNode, ZipNode, OrElseEitherNode, SequenceNode,
                            OptionalNode, DefaultNode, TransformNode, DescribeNode,
                            SourcedFromNode>;
    Op op;
};

template<typename Op>
NodePtr make_node(Op op) {
    return std::make_shared<const DescriptorNode>(DescriptorNode{std::move(op)});
}

/**
 * @brief Node kind name for diagnostics ("Value", "Nested", ...)
 */
CONFIX_API std::string_view node_name(const DescriptorNode& node) noexcept;

namespace detail {

template<typename T>
struct is_tuple_like : std::false_type {};

template<typename... Ts>
struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};

template<typename A, typename B>
struct is_tuple_like<std::pair<A, B>> : std::true_type {};

template<typename T>
concept HasPropertyType = requires(const T& v) {
    { PropertyType<T>::render(v) } -> std::convertible_to<std::string>;
};

template<typename T>
std::optional<std::string> render_default(const T& value) {
    if constexpr (HasPropertyType<T>) {
        return PropertyType<T>::render(value);
    } else {
        return std::nullopt;
    }
}

template<typename E>
std::optional<std::string> render_default(const std::vector<E>& values) {
    if constexpr (HasPropertyType<E>) {
        std::string out;
        for (const auto& v : values) {
            out += (out.empty() ? "" : ", ") + PropertyType<E>::render(v);
        }
        return "[" + out + "]";
    } else {
        return std::nullopt;
    }
}

}  // namespace detail

// ============================================================================
// TYPED DESCRIPTOR
// ============================================================================

template<typename T>
class ConfigDescriptor {
public:
    using value_type = T;

    explicit ConfigDescriptor(NodePtr node) : node_(std::move(node)) {}

    const NodePtr& node() const noexcept { return node_; }

    /**
     * @brief Absent instead of failing when nothing is configured
     *
     * A value that is present but malformed still fails.
     */
    ConfigDescriptor<std::optional<T>> optional() const {
        OptionalNode op;
        op.inner = node_;
        op.wrap  = [](std::optional<std::any> v) -> std::any {
            if (!v) {
                return std::any(std::optional<T>());
            }
            return std::any(std::optional<T>(std::any_cast<T>(std::move(*v))));
        };
        op.unwrap = [](const std::any& v) -> std::optional<std::any> {
            const auto& present = std::any_cast<const std::optional<T>&>(v);
            if (!present) {
                return std::nullopt;
            }
            return std::any(*present);
        };
        return ConfigDescriptor<std::optional<T>>(make_node(std::move(op)));
    }

    /**
     * @brief Use @p value when nothing is configured
     *
     * Only read-side: the writer always emits the actual value.
     */
    ConfigDescriptor<T> default_value(T value) const {
        DefaultNode op;
        op.inner    = node_;
        op.rendered = detail::render_default(value);
        op.fallback = std::any(std::move(value));
        return ConfigDescriptor<T>(make_node(std::move(op)));
    }

    /**
     * @brief Map to another type with a total conversion in each direction
     */
    template<typename F, typename G>
    auto transform(F forward, G backward) const
        -> ConfigDescriptor<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
        using B = std::decay_t<std::invoke_result_t<const F&, const T&>>;

        TransformNode op;
        op.inner   = node_;
        op.forward = [forward](const std::any& a) -> common::Result<std::any> {
            return std::any(B(forward(std::any_cast<const T&>(a))));
        };
        op.backward = [backward](const std::any& b) -> common::Result<std::any> {
            return std::any(T(backward(std::any_cast<const B&>(b))));
        };
        return ConfigDescriptor<B>(make_node(std::move(op)));
    }

    /**
     * @brief Map to another type where either direction may fail
     *
     * @p forward returns common::Result<B>; its error message is reported as a
     * conversion error at this descriptor's path. @p backward returns
     * common::Result<T>.
     */
    template<typename F, typename G>
    auto transform_or_fail(F forward, G backward) const
        -> ConfigDescriptor<typename std::invoke_result_t<const F&, const T&>::value_type> {
        using B = typename std::invoke_result_t<const F&, const T&>::value_type;

        TransformNode op;
        op.inner   = node_;
        op.forward = [forward](const std::any& a) -> common::Result<std::any> {
            auto result = forward(std::any_cast<const T&>(a));
            if (result.is_error()) {
                return result.error();
            }
            return std::any(std::move(result).value());
        };
        op.backward = [backward](const std::any& b) -> common::Result<std::any> {
            auto result = backward(std::any_cast<const B&>(b));
            if (result.is_error()) {
                return result.error();
            }
            return std::any(std::move(result).value());
        };
        return ConfigDescriptor<B>(make_node(std::move(op)));
    }

    ConfigDescriptor<T> describe(std::string text) const {
        return ConfigDescriptor<T>(make_node(DescribeNode{node_, std::move(text)}));
    }

    /**
     * @brief Read this part of the schema from @p source only
     */
    ConfigDescriptor<T> from(ConfigSource source) const {
        return ConfigDescriptor<T>(make_node(SourcedFromNode{node_, std::move(source)}));
    }

    template<typename U>
    ConfigDescriptor<std::pair<T, U>> zip(const ConfigDescriptor<U>& that) const {
        ZipNode op;
        op.left    = node_;
        op.right   = that.node();
        op.combine = [](std::any l, std::any r) {
            return std::any(std::pair<T, U>(std::any_cast<T>(std::move(l)),
                                            std::any_cast<U>(std::move(r))));
        };
        op.split = [](const std::any& v) {
            const auto& p = std::any_cast<const std::pair<T, U>&>(v);
            return std::make_pair(std::any(p.first), std::any(p.second));
        };
        return ConfigDescriptor<std::pair<T, U>>(make_node(std::move(op)));
    }

    /**
     * @brief This descriptor, or @p that when this one cannot be read
     */
    template<typename U>
    ConfigDescriptor<Either<T, U>> or_else_either(const ConfigDescriptor<U>& that) const {
        OrElseEitherNode op;
        op.left      = node_;
        op.right     = that.node();
        op.make_left = [](std::any v) {
            return std::any(Either<T, U>(std::in_place_index<0>, std::any_cast<T>(std::move(v))));
        };
        op.make_right = [](std::any v) {
            return std::any(Either<T, U>(std::in_place_index<1>, std::any_cast<U>(std::move(v))));
        };
        op.select = [](const std::any& v) -> std::pair<bool, std::any> {
            const auto& either = std::any_cast<const Either<T, U>&>(v);
            if (either.index() == 0) {
                return {true, std::any(std::get<0>(either))};
            }
            return {false, std::any(std::get<1>(either))};
        };
        return ConfigDescriptor<Either<T, U>>(make_node(std::move(op)));
    }

    /**
     * @brief Same-typed fallback; written back through this descriptor
     */
    ConfigDescriptor<T> or_else(const ConfigDescriptor<T>& that) const {
        return or_else_either(that).transform(
            [](const Either<T, T>& e) { return e.index() == 0 ? std::get<0>(e) : std::get<1>(e); },
            [](const T& v) { return Either<T, T>(std::in_place_index<0>, v); });
    }

    /**
     * @brief Build an R from this descriptor's value
     *
     * Tuples and pairs are spread over R's constructor (or aggregate fields).
     * @p unapply takes an R back apart for writing.
     */
    template<typename R, typename Unapply>
    ConfigDescriptor<R> to(Unapply unapply) const {
        return transform(
            [](const T& v) {
                if constexpr (detail::is_tuple_like<T>::value) {
                    return std::make_from_tuple<R>(v);
                } else {
                    return R{v};
                }
            },
            [unapply](const R& r) { return T(unapply(r)); });
    }

private:
    NodePtr node_;
};

// ============================================================================
// BUILDERS
// ============================================================================

template<typename T>
ConfigDescriptor<T> value(std::string key) {
    ValueNode op;
    op.key  = std::move(key);
    op.type = make_type_info<T>();
    return ConfigDescriptor<T>(make_node(std::move(op)));
}

/// Scalar at the current path (list elements, for instance)
template<typename T>
ConfigDescriptor<T> value() {
    ValueNode op;
    op.type = make_type_info<T>();
    return ConfigDescriptor<T>(make_node(std::move(op)));
}

inline ConfigDescriptor<std::string> string(std::string key) { return value<std::string>(std::move(key)); }
inline ConfigDescriptor<std::string> string() { return value<std::string>(); }

inline ConfigDescriptor<bool> boolean(std::string key) { return value<bool>(std::move(key)); }
inline ConfigDescriptor<bool> boolean() { return value<bool>(); }

inline ConfigDescriptor<int32_t> int32(std::string key) { return value<int32_t>(std::move(key)); }
inline ConfigDescriptor<int32_t> int32() { return value<int32_t>(); }

inline ConfigDescriptor<int64_t> int64(std::string key) { return value<int64_t>(std::move(key)); }
inline ConfigDescriptor<int64_t> int64() { return value<int64_t>(); }

inline ConfigDescriptor<uint32_t> uint32(std::string key) { return value<uint32_t>(std::move(key)); }
inline ConfigDescriptor<uint32_t> uint32() { return value<uint32_t>(); }

inline ConfigDescriptor<uint64_t> uint64(std::string key) { return value<uint64_t>(std::move(key)); }
inline ConfigDescriptor<uint64_t> uint64() { return value<uint64_t>(); }

inline ConfigDescriptor<float> float32(std::string key) { return value<float>(std::move(key)); }
inline ConfigDescriptor<float> float32() { return value<float>(); }

inline ConfigDescriptor<double> float64(std::string key) { return value<double>(std::move(key)); }
inline ConfigDescriptor<double> float64() { return value<double>(); }

inline ConfigDescriptor<std::chrono::milliseconds> duration(std::string key) {
    return value<std::chrono::milliseconds>(std::move(key));
}
inline ConfigDescriptor<std::chrono::milliseconds> duration() {
    return value<std::chrono::milliseconds>();
}

template<typename T>
ConfigDescriptor<T> nested(std::string key, const ConfigDescriptor<T>& inner) {
    return ConfigDescriptor<T>(make_node(NestedNode{std::move(key), inner.node()}));
}

/**
 * @brief Every element of a sequence read through @p inner
 */
template<typename T>
ConfigDescriptor<std::vector<T>> list(const ConfigDescriptor<T>& inner) {
    SequenceNode op;
    op.inner   = inner.node();
    op.collect = [](std::vector<std::any> elements) {
        std::vector<T> out;
        out.reserve(elements.size());
        for (auto& e : elements) {
            out.push_back(std::any_cast<T>(std::move(e)));
        }
        return std::any(std::move(out));
    };
    op.elements = [](const std::any& v) {
        const auto& typed = std::any_cast<const std::vector<T>&>(v);
        std::vector<std::any> out;
        out.reserve(typed.size());
        for (const auto& e : typed) {
            out.emplace_back(T(e));
        }
        return out;
    };
    return ConfigDescriptor<std::vector<T>>(make_node(std::move(op)));
}

template<typename T>
ConfigDescriptor<std::vector<T>> list(std::string key, const ConfigDescriptor<T>& inner) {
    return nested(std::move(key), list(inner));
}

template<typename T, typename U>
ConfigDescriptor<std::pair<T, U>> zip(const ConfigDescriptor<T>& left, const ConfigDescriptor<U>& right) {
    return left.zip(right);
}

template<typename T>
ConfigDescriptor<std::tuple<T>> zip_all(const ConfigDescriptor<T>& only) {
    return only.transform([](const T& v) { return std::tuple<T>(v); },
                          [](const std::tuple<T>& t) { return std::get<0>(t); });
}

/**
 * @brief Several descriptors read together into a tuple
 */
template<typename T, typename U, typename... Rest>
ConfigDescriptor<std::tuple<T, U, Rest...>> zip_all(const ConfigDescriptor<T>& first,
                                                    const ConfigDescriptor<U>& second,
                                                    const ConfigDescriptor<Rest>&... rest) {
    using Tail = std::tuple<U, Rest...>;
    return first.zip(zip_all(second, rest...))
        .transform(
            [](const std::pair<T, Tail>& p) { return std::tuple_cat(std::tuple<T>(p.first), p.second); },
            [](const std::tuple<T, U, Rest...>& t) {
                return std::apply(
                    [](const T& head, const U& next, const Rest&... tail) {
                        return std::pair<T, Tail>(head, Tail(next, tail...));
                    },
                    t);
            });
}

}  // namespace confix::core::config
