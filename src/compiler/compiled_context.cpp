#include <sandtest/compiler/compiled_context.hpp>

#include <sandtest/common/expected.hpp>
#include <sandtest/common/linux.hpp>
#include <sandtest/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <dlfcn.h>

namespace sandtest {

CheckContainer::CheckContainer(const CheckEntry* table) {
    ASSERT(table != nullptr);

    for (const CheckEntry* entry = table; entry->name != nullptr; ++entry) {
        routines_.emplace(entry->name, entry->routine);
    }
}

CheckRoutine CheckContainer::find(const std::string& name) const {
    auto iter = routines_.find(name);

    if (iter == routines_.end()) {
        return nullptr;
    }

    return iter->second;
}

std::vector<std::string> CheckContainer::get_names() const {
    std::vector<std::string> names;
    names.reserve(routines_.size());

    for (const auto& [name, routine] : routines_) {
        names.push_back(name);
    }

    return names;
}

CompiledContext::CompiledContext(int memfd)
    : memfd_{memfd} {}

CompiledContext::~CompiledContext() {
    release();
}

CompiledContext::CompiledContext(CompiledContext&& other) noexcept
    : memfd_{std::exchange(other.memfd_, -1)}
    , handle_{std::exchange(other.handle_, nullptr)} {}

CompiledContext& CompiledContext::operator=(CompiledContext&& rhs) noexcept {
    if (this != &rhs) {
        release();
        memfd_ = std::exchange(rhs.memfd_, -1);
        handle_ = std::exchange(rhs.handle_, nullptr);
    }

    return *this;
}

void CompiledContext::release() {
    if (handle_ != nullptr) {
        if (dlclose(handle_) != 0) {
            LOG_WARN("dlclose failed: {}", dlerror());
        }
        handle_ = nullptr;
    }

    if (memfd_ != -1) {
        std::ignore = linux::close(memfd_);
        memfd_ = -1;
    }
}

Expected<void, std::string> CompiledContext::ensure_loaded() {
    if (handle_ != nullptr) {
        return {};
    }

    if (memfd_ == -1) {
        return "compiled unit is no longer available";
    }

    // The anonymous file has no path of its own; the loader accepts its /proc alias
    std::string path = fmt::format("/proc/self/fd/{}", memfd_);

    handle_ = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);

    if (handle_ == nullptr) {
        const char* err = dlerror();
        std::string msg = err != nullptr ? err : fmt::format("dlopen of {} failed", path);
        LOG_ERROR("Failed to load compiled unit: {}", msg);
        return msg;
    }

    LOG_DEBUG("Loaded compiled unit from {}", path);

    return {};
}

Expected<CheckContainer, std::string> CompiledContext::load_container(std::string_view name) {
    if (auto res = ensure_loaded(); !res) {
        return res.error();
    }

    std::string symbol = fmt::format("{}_checks", name);

    // Clear any stale error before dlsym, see dlsym(3)
    dlerror();
    void* table = dlsym(handle_, symbol.c_str());

    if (table == nullptr) {
        const char* err = dlerror();
        std::string msg = err != nullptr ? err : fmt::format("{} resolved to null", symbol);
        LOG_ERROR("Failed to resolve {}: {}", symbol, msg);
        return msg;
    }

    CheckContainer container{static_cast<const CheckEntry*>(table)};

    LOG_DEBUG("Resolved {} with {} routine(s)", symbol, container.size());

    return container;
}

} // namespace sandtest
