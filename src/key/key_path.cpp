#include "objkey/key/key_path.h"

namespace objkey::key {

namespace {

std::vector<std::string_view> SplitDelimited(std::string_view input) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = input.find(kSeparator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(input.substr(start));
            break;
        }
        parts.push_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

template <typename Component, typename Range>
core::Result<BasicKeyPath<Component>> BuildFrom(const Range& components) {
    BasicKeyPath<Component> path;
    for (const auto& component : components) {
        auto joined = path.Join(component);
        if (!joined.ok()) {
            return joined.error();
        }
    }
    return path;
}

}  // namespace

template <typename Component>
core::Result<BasicKeyPath<Component>> BasicKeyPath<Component>::Create(
    std::initializer_list<std::string_view> components) {
    return BuildFrom<Component>(components);
}

template <typename Component>
core::Result<BasicKeyPath<Component>> BasicKeyPath<Component>::Create(
    const std::vector<std::string_view>& components) {
    return BuildFrom<Component>(components);
}

template <typename Component>
core::Result<BasicKeyPath<Component>> BasicKeyPath<Component>::Create(
    const std::vector<std::string>& components) {
    return BuildFrom<Component>(components);
}

template <typename Component>
core::Result<BasicKeyPath<Component>> BasicKeyPath<Component>::FromDelimited(
    std::string_view input) {
    // For KeyPathView the pieces reference `input` directly.
    return BuildFrom<Component>(SplitDelimited(input));
}

template <typename Component>
core::Result<void> BasicKeyPath<Component>::Join(std::string_view candidate) {
    auto validated = ValidateComponent(candidate);
    if (!validated.ok()) {
        core::Error error = validated.error();
        error.index = components_.size();
        return error;
    }
    components_.emplace_back(validated.value());
    return core::Ok();
}

template <typename Component>
std::string BasicKeyPath<Component>::Render() const {
    std::size_t length = components_.empty() ? 0 : components_.size() - 1;
    for (const auto& component : components_) {
        length += component.size();
    }
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < components_.size(); ++i) {
        if (i > 0) {
            out += kSeparator;
        }
        out += components_[i];
    }
    return out;
}

template <typename Component>
std::filesystem::path BasicKeyPath<Component>::ToFilesystemPath() const {
    return ResolveUnder(std::filesystem::path());
}

template <typename Component>
std::filesystem::path BasicKeyPath<Component>::ResolveUnder(
    const std::filesystem::path& root) const {
    std::filesystem::path path = root;
    for (const auto& component : components_) {
        path /= std::string_view(component);
    }
    return path;
}

template <typename Component>
BasicKeyPath<std::string> BasicKeyPath<Component>::ToOwned() const {
    // Components were validated on the way in; copying needs no re-check.
    std::vector<std::string> owned;
    owned.reserve(components_.size());
    for (const auto& component : components_) {
        owned.emplace_back(component);
    }
    return BasicKeyPath<std::string>(std::move(owned));
}

template <typename Component>
BasicKeyPath<std::string_view> BasicKeyPath<Component>::AsView() const {
    std::vector<std::string_view> view;
    view.reserve(components_.size());
    for (const auto& component : components_) {
        view.emplace_back(component);
    }
    return BasicKeyPath<std::string_view>(std::move(view));
}

template class BasicKeyPath<std::string>;
template class BasicKeyPath<std::string_view>;

}  // namespace objkey::key
