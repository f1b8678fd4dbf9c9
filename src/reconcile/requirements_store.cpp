#include "reconcile/requirements_store.h"
#include "common/logging.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace autoscale {
namespace reconcile {

namespace {
const std::string kModule = "store";
} // namespace

RequirementsStore::RequirementsStore()
    : RequirementsStore(RequirementsDocument()) {}

RequirementsStore::RequirementsStore(RequirementsDocument initial)
    : document_(std::move(initial)), generation_(0), notified_generation_(0),
      shutdown_(false) {
  notifier_ = std::thread(&RequirementsStore::notifier_loop, this);
}

RequirementsStore::~RequirementsStore() {
  {
    std::lock_guard<std::mutex> lock(notify_mutex_);
    shutdown_ = true;
  }
  notify_cv_.notify_all();
  if (notifier_.joinable()) {
    notifier_.join();
  }
}

RequirementsDocument RequirementsStore::get_requirements() {
  std::lock_guard<std::mutex> lock(document_mutex_);
  return document_;
}

void RequirementsStore::set_requirements(RequirementsDocument document) {
  {
    std::lock_guard<std::mutex> lock(document_mutex_);
    document_ = std::move(document);
  }
  {
    std::lock_guard<std::mutex> lock(notify_mutex_);
    generation_.fetch_add(1);
  }
  notify_cv_.notify_all();
}

void RequirementsStore::track_configuration(ConfigurationCallback callback) {
  if (!callback) {
    return;
  }
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  if (std::find(callbacks_.begin(), callbacks_.end(), callback) ==
      callbacks_.end()) {
    callbacks_.push_back(std::move(callback));
  }
}

void RequirementsStore::untrack_configuration(
    const ConfigurationCallback &callback) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  callbacks_.erase(std::remove(callbacks_.begin(), callbacks_.end(), callback),
                   callbacks_.end());
}

size_t RequirementsStore::tracked_count() const {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  return callbacks_.size();
}

void RequirementsStore::notifier_loop() {
  std::unique_lock<std::mutex> lock(notify_mutex_);
  while (true) {
    notify_cv_.wait(lock, [this] {
      return shutdown_ || generation_.load() != notified_generation_;
    });
    if (shutdown_) {
      return;
    }
    notified_generation_ = generation_.load();
    lock.unlock();

    std::vector<ConfigurationCallback> callbacks;
    {
      std::lock_guard<std::mutex> callbacks_lock(callbacks_mutex_);
      callbacks = callbacks_;
    }
    LOG_DEBUG(kModule, "requirements changed; notifying ", callbacks.size(),
              " tracker(s)");
    for (const auto &callback : callbacks) {
      try {
        (*callback)();
      } catch (const std::exception &e) {
        LOG_ERROR(kModule, "configuration callback failed: ", e.what());
      }
    }

    lock.lock();
  }
}

common::Result<bool> RequirementsStore::load_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return common::Result<bool>("cannot open requirements file " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_requirements(buffer.str());
  if (parsed.is_err()) {
    return common::Result<bool>(path + ": " + parsed.error());
  }
  LOG_INFO(kModule, "loaded ", parsed.value().size(),
           " profile requirement(s) from ", path);
  set_requirements(std::move(parsed).value());
  return common::Result<bool>(true);
}

common::Result<bool> RequirementsStore::save_file(const std::string &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return common::Result<bool>("cannot write requirements file " + path);
  }
  RequirementsDocument document;
  {
    std::lock_guard<std::mutex> lock(document_mutex_);
    document = document_;
  }
  file << to_json(document).dump(2) << std::endl;
  if (!file.good()) {
    return common::Result<bool>("failed writing requirements file " + path);
  }
  return common::Result<bool>(true);
}

} // namespace reconcile
} // namespace autoscale
