#include "fpservice/storage/TemplateRegistry.hpp"
#include "fpservice/storage/TemplateDocument.hpp"
#include "fpservice/core/Logger.hpp"

#include <algorithm>
#include <utility>

namespace fpservice {
namespace storage {

TemplateRegistry::TemplateRegistry(int32_t userId, Options options)
    : user_id_(userId)
    , options_(std::move(options))
    , file_(options_.file_path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        readStateLocked();
    }

    writer_ = std::make_unique<SnapshotWriteQueue>(
        [this](const std::vector<Template>& snapshot) { writeSnapshot(snapshot); },
        options_.write_queue_capacity,
        "templates[user " + std::to_string(user_id_) + "]");
}

TemplateRegistry::~TemplateRegistry() {
    // The worker calls back into file_, so it must stop first
    writer_.reset();
}

std::vector<Template> TemplateRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return templates_;
}

std::optional<Template> TemplateRegistry::find(int32_t templateId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(templates_.begin(), templates_.end(),
                           [templateId](const Template& t) { return t.template_id == templateId; });
    if (it == templates_.end()) {
        return std::nullopt;
    }
    return *it;
}

size_t TemplateRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return templates_.size();
}

Template TemplateRegistry::add(int32_t templateId, int32_t groupId) {
    return add(templateId, groupId, std::string());
}

Template TemplateRegistry::add(int32_t templateId, int32_t groupId, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string assigned = name;
    if (assigned.empty() || !isNameUniqueLocked(assigned)) {
        if (!assigned.empty()) {
            LOG_WARNING("Template name '" + assigned + "' already used, generating one");
        }
        assigned = generateUniqueNameLocked();
    }

    Template tmpl(assigned, groupId, templateId, 0);
    std::vector<Template> next = templates_;
    next.push_back(tmpl);
    commitLocked(std::move(next));

    FPSERVICE_LOG_INFO("TemplateRegistry") << "user " << user_id_ << ": added template "
                                           << templateId << " as '" << assigned << "'";
    return tmpl;
}

bool TemplateRegistry::remove(int32_t templateId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Template> next = templates_;
    auto it = std::find_if(next.begin(), next.end(),
                           [templateId](const Template& t) { return t.template_id == templateId; });
    if (it == next.end()) {
        FPSERVICE_LOG_DEBUG("TemplateRegistry") << "user " << user_id_ << ": no template "
                                                << templateId << " to remove";
        return false;
    }

    next.erase(it);
    commitLocked(std::move(next));

    FPSERVICE_LOG_INFO("TemplateRegistry") << "user " << user_id_ << ": removed template " << templateId;
    return true;
}

bool TemplateRegistry::rename(int32_t templateId, const std::string& newName) {
    if (newName.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Template> next = templates_;
    for (auto& tmpl : next) {
        if (tmpl.template_id == templateId) {
            tmpl.name = newName;
            commitLocked(std::move(next));
            return true;
        }
    }
    return false;
}

void TemplateRegistry::flush() {
    writer_->flush();
}

bool TemplateRegistry::hasPendingWrites() const {
    return !writer_->isIdle();
}

std::string TemplateRegistry::formatName(int index) const {
    std::string name = options_.name_template;
    const std::string token = "%d";
    size_t pos = name.find(token);
    if (pos == std::string::npos) {
        return name + " " + std::to_string(index);
    }
    return name.replace(pos, token.size(), std::to_string(index));
}

std::string TemplateRegistry::generateUniqueNameLocked() const {
    // Linear probe, users rarely have more than a handful of templates
    for (int guess = 1;; ++guess) {
        std::string name = formatName(guess);
        if (isNameUniqueLocked(name)) {
            return name;
        }
    }
}

bool TemplateRegistry::isNameUniqueLocked(const std::string& name) const {
    return std::none_of(templates_.begin(), templates_.end(),
                        [&name](const Template& t) { return t.name == name; });
}

void TemplateRegistry::commitLocked(std::vector<Template> next) {
    // The snapshot is queued first; a poisoned writer throws before anything changes
    writer_->push(next);
    templates_ = std::move(next);
}

void TemplateRegistry::writeSnapshot(const std::vector<Template>& snapshot) {
    file_.write(TemplateDocument::serialize(snapshot));
    FPSERVICE_LOG_DEBUG("TemplateRegistry") << "user " << user_id_ << ": wrote "
                                            << snapshot.size() << " templates to " << file_.getPath();
}

void TemplateRegistry::readStateLocked() {
    std::optional<std::string> contents = file_.read();
    if (!contents) {
        FPSERVICE_LOG_INFO("TemplateRegistry") << "user " << user_id_ << ": no template state at "
                                               << file_.getPath();
        return;
    }

    templates_ = TemplateDocument::parse(*contents, file_.getPath());
    FPSERVICE_LOG_INFO("TemplateRegistry") << "user " << user_id_ << ": loaded "
                                           << templates_.size() << " templates";
}

} // namespace storage
} // namespace fpservice
