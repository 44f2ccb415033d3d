#pragma once

#include <sandtest/common/class_traits.hpp>
#include <sandtest/common/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sandtest {

/// A check routine generated into the check unit. Returns whether the submission's result
/// matched the expected output
using CheckRoutine = bool (*)();

/// One row of the extern "C" `<name>_checks` table. Must stay layout compatible with the
/// `SandtestCheckEntry` struct emitted by the source synthesizer
struct CheckEntry
{
    const char* name;
    CheckRoutine routine;
};

/// Name -> routine lookup table for one loaded check unit
class CheckContainer
{
public:
    CheckContainer() = default;

    /// Copies entries from a null-terminated table
    explicit CheckContainer(const CheckEntry* table);

    /// Whether a routine was registered under ``name``, even if its pointer is null
    bool contains(const std::string& name) const { return routines_.contains(name); }

    /// nullptr if absent, or if registered with a null routine
    CheckRoutine find(const std::string& name) const;

    std::size_t size() const { return routines_.size(); }

    std::vector<std::string> get_names() const;

private:
    std::unordered_map<std::string, CheckRoutine> routines_;
};

/// A successfully compiled shared object, held in an anonymous in-memory file.
///
/// The object is dlopen'ed on first use and unloaded when the context is destroyed. Every
/// routine obtained through load_container is only valid for the lifetime of its context.
class CompiledContext : NonCopyable
{
public:
    /// Takes ownership of ``memfd``
    explicit CompiledContext(int memfd);
    ~CompiledContext();
    CompiledContext(CompiledContext&& other) noexcept;
    CompiledContext& operator=(CompiledContext&& rhs) noexcept;

    /// Loads the object (if not already loaded) and resolves the `<name>_checks` table.
    /// Returns the loader's error message on failure
    Expected<CheckContainer, std::string> load_container(std::string_view name);

    int get_fd() const { return memfd_; }

    bool is_loaded() const { return handle_ != nullptr; }

private:
    Expected<void, std::string> ensure_loaded();
    void release();

    int memfd_ = -1;
    void* handle_ = nullptr;
};

} // namespace sandtest
