/**
 * @file container.cpp
 * @brief Container implementation.
 */

#include "session/container.hpp"

namespace diagnostics_engine {

std::shared_ptr<Container> Container::create_root(std::string name, std::filesystem::path folder) {
    return std::make_shared<Container>(PrivateTag{}, std::move(name), std::move(folder),
                                       std::nullopt, "", false);
}

std::shared_ptr<Container> Container::create_detached(std::string name, std::filesystem::path folder) {
    return std::make_shared<Container>(PrivateTag{}, std::move(name), std::move(folder),
                                       std::nullopt, "", true);
}

Container::Container(PrivateTag,
                     std::string name,
                     std::filesystem::path folder,
                     std::optional<std::string> relative_folder,
                     std::string archive_prefix,
                     bool detached)
    : name_(std::move(name))
    , folder_(std::move(folder))
    , relative_folder_(std::move(relative_folder))
    , archive_prefix_(std::move(archive_prefix))
    , detached_(detached) {}

Result<void> Container::check_accepting() const {
    if (detached_) {
        return Error{ErrorCode::IllegalState, "Container '" + name_ + "' is detached"};
    }
    if (archived_.load()) {
        return Error{ErrorCode::IllegalState, "Container '" + name_ + "' was already archived"};
    }
    return {};
}

Result<std::shared_ptr<Container>> Container::create_child(std::string name,
                                                           std::string relative_folder) {
    if (auto r = check_accepting(); !r) return r.error();
    if (relative_folder.empty()) {
        return Error{ErrorCode::InvalidArgument, "Child container '" + name + "' needs a folder"};
    }

    auto folder = folder_ / relative_folder;
    auto prefix = archive_prefix_ + relative_folder + "/";
    auto child = std::make_shared<Container>(PrivateTag{}, std::move(name), std::move(folder),
                                             std::move(relative_folder), std::move(prefix), false);
    children_.push(child);
    return child;
}

Result<void> Container::add(std::unique_ptr<Content> content) {
    if (!content) {
        return Error{ErrorCode::InvalidArgument, "Null content"};
    }
    if (auto r = check_accepting(); !r) return r;
    contents_.push(std::move(content));
    return {};
}

Result<void> Container::record_failure(std::string title, std::string detail) {
    if (auto r = check_accepting(); !r) return r;
    failures_.push(Failure{std::move(title), std::move(detail)});
    return {};
}

void Container::set_manifest_details(std::string details) {
    std::lock_guard lock(details_mutex_);
    manifest_details_ = std::move(details);
}

std::optional<std::string> Container::manifest_details() const {
    std::lock_guard lock(details_mutex_);
    return manifest_details_;
}

bool Container::begin_archive() noexcept {
    return !archived_.exchange(true);
}

}  // namespace diagnostics_engine
