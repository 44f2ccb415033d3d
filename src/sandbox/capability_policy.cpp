#include <sandtest/sandbox/capability_policy.hpp>

#include <sandtest/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <sys/syscall.h>

namespace sandtest {

namespace {

struct DeniedSyscall
{
    SyscallCategory category;
    long nr; // NOLINT(google-runtime-int)
    std::string_view name;
};

constexpr std::array DENIED_SYSCALLS = {
#define SANDTEST_DENY(category, name) DeniedSyscall{SyscallCategory::category, SYS_##name, #name},
#include "sandbox/denied_syscalls.inl"
#undef SANDTEST_DENY
};

std::atomic<const CapabilityPolicy*> installed_policy{nullptr};

const DeniedSyscall* find_denied(long syscall_nr) { // NOLINT(google-runtime-int)
    auto iter = ranges::find_if(DENIED_SYSCALLS, [syscall_nr](const DeniedSyscall& entry) {
        return entry.nr == syscall_nr;
    });

    if (iter == DENIED_SYSCALLS.end()) {
        return nullptr;
    }

    return &*iter;
}

} // namespace

bool PolicyOptions::denies(SyscallCategory category) const {
    switch (category) {
    case SyscallCategory::Termination:
        return deny_termination;
    case SyscallCategory::Creation:
        return deny_creation;
    case SyscallCategory::Filesystem:
        return deny_filesystem;
    case SyscallCategory::Network:
        return deny_network;
    case SyscallCategory::Escape:
        return deny_escape;
    }

    return true;
}

CapabilityPolicy::CapabilityPolicy(PolicyOptions options)
    : options_{options} {
    for (const DeniedSyscall& entry : DENIED_SYSCALLS) {
        if (options_.denies(entry.category) && entry.nr >= 0 && static_cast<std::size_t>(entry.nr) < MAX_SYSCALL_NR) {
            denied_.set(static_cast<std::size_t>(entry.nr));
        }
    }
}

const CapabilityPolicy& CapabilityPolicy::install(PolicyOptions options) {
    // Initialization of a function-local static is thread-safe; only the first caller's options are used
    static const CapabilityPolicy instance{options};

    if (installed_policy.exchange(&instance, std::memory_order_acq_rel) == nullptr) {
        LOG_DEBUG("Installed capability policy {} ({} syscalls denied)", instance.get_options(), instance.num_denied());
    }

    if (instance.get_options() != options) {
        LOG_WARN("Capability policy is already installed with {}; ignoring request for {}", instance.get_options(),
                 options);
    }

    return instance;
}

const CapabilityPolicy* CapabilityPolicy::installed() {
    return installed_policy.load(std::memory_order_acquire);
}

bool CapabilityPolicy::permits(long syscall_nr) const noexcept { // NOLINT(google-runtime-int)
    if (syscall_nr < 0 || static_cast<std::size_t>(syscall_nr) >= MAX_SYSCALL_NR) {
        return false;
    }

    return !denied_.test(static_cast<std::size_t>(syscall_nr));
}

// NOLINTNEXTLINE(google-runtime-int)
bool CapabilityPolicy::permits_call(long syscall_nr, std::span<const std::uint64_t> args, pid_t caller) const noexcept {
    if (permits(syscall_nr)) {
        return true;
    }

#ifdef SYS_tgkill
    // Workers are single threaded, so their own tgid and tid are both the pid
    if (syscall_nr == SYS_tgkill && args.size() >= 2 && caller > 0) {
        const auto self = static_cast<std::uint64_t>(caller);
        return args[0] == self && args[1] == self;
    }
#endif

    return false;
}

std::optional<SyscallCategory> CapabilityPolicy::category_of(long syscall_nr) { // NOLINT(google-runtime-int)
    if (const DeniedSyscall* entry = find_denied(syscall_nr)) {
        return entry->category;
    }

    return std::nullopt;
}

std::string CapabilityPolicy::describe(long syscall_nr) { // NOLINT(google-runtime-int)
    if (const DeniedSyscall* entry = find_denied(syscall_nr)) {
        return std::string{entry->name};
    }

    return fmt::format("syscall {}", syscall_nr);
}

} // namespace sandtest
