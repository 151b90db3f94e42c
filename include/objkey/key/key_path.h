#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "objkey/core/result.h"
#include "objkey/key/component_validator.h"

namespace objkey::key {

/// @brief Validated object-storage key: an ordered list of components joined by '/'.
///
/// Every component held by a key has passed ValidateComponent(); factories fail
/// atomically and Join() leaves the key unchanged on failure. `Component` selects the
/// storage: std::string owns the text (KeyPath), std::string_view borrows it
/// (KeyPathView) and must not outlive the referenced characters.
///
/// Not internally synchronized; concurrent Join() calls on one key need external locking.
template <typename Component>
class BasicKeyPath {
public:
    using component_type = Component;
    using container_type = std::vector<Component>;

    BasicKeyPath() = default;

    /// @brief Build a key from already-separated components, validating each in order.
    ///
    /// Stops at the first invalid component; the error's `index` is its list position.
    /// Components are never re-split, so an element containing '/' is rejected.
    static core::Result<BasicKeyPath> Create(std::initializer_list<std::string_view> components);
    static core::Result<BasicKeyPath> Create(const std::vector<std::string_view>& components);
    static core::Result<BasicKeyPath> Create(const std::vector<std::string>& components);

    /// @brief Split `input` on '/' and build a key from the pieces.
    ///
    /// Empty pieces (from "", a leading/trailing '/' or "//") are rejected, not skipped.
    static core::Result<BasicKeyPath> FromDelimited(std::string_view input);

    /// @brief Variadic shorthand for Create({parts...}).
    template <typename... Parts>
    static core::Result<BasicKeyPath> Of(const Parts&... parts) {
        return Create({std::string_view(parts)...});
    }

    /// @brief Validate `candidate` and append it. On failure the key is unchanged.
    core::Result<void> Join(std::string_view candidate);

    /// @brief Components joined with '/'; the empty key renders as "".
    std::string Render() const;

    /// @brief Relative filesystem path with one element per component.
    std::filesystem::path ToFilesystemPath() const;
    /// @brief `root` followed by every component; always lexically inside `root`.
    std::filesystem::path ResolveUnder(const std::filesystem::path& root) const;

    BasicKeyPath<std::string> ToOwned() const;
    /// @brief Borrowing view of this key; valid while this key is alive and unmodified.
    BasicKeyPath<std::string_view> AsView() const;

    const container_type& components() const { return components_; }
    std::size_t size() const { return components_.size(); }
    bool empty() const { return components_.empty(); }

private:
    template <typename>
    friend class BasicKeyPath;

    explicit BasicKeyPath(container_type components) : components_(std::move(components)) {}

    container_type components_;
};

using KeyPath = BasicKeyPath<std::string>;
using KeyPathView = BasicKeyPath<std::string_view>;

extern template class BasicKeyPath<std::string>;
extern template class BasicKeyPath<std::string_view>;

template <typename L, typename R>
bool operator==(const BasicKeyPath<L>& lhs, const BasicKeyPath<R>& rhs) {
    const auto& a = lhs.components();
    const auto& b = rhs.components();
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const L& x, const R& y) {
        return std::string_view(x) == std::string_view(y);
    });
}

template <typename L, typename R>
bool operator!=(const BasicKeyPath<L>& lhs, const BasicKeyPath<R>& rhs) {
    return !(lhs == rhs);
}

template <typename Component>
std::ostream& operator<<(std::ostream& os, const BasicKeyPath<Component>& path) {
    bool first = true;
    for (const auto& component : path.components()) {
        if (!first) {
            os << kSeparator;
        }
        os << std::string_view(component);
        first = false;
    }
    return os;
}

}  // namespace objkey::key
