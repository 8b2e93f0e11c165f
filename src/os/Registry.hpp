#pragma once

#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "Error.hpp"
#include "Os.hpp"

namespace Os
{

class [[nodiscard]] Registry final
{
  public:
    struct [[nodiscard]] Entry final
    {
        Process  process;
        RunState state;
    };

    // Registration order is preserved; scheduling never depends on it, only presentation does.
    [[nodiscard]] auto add(Process process) -> std::expected<void, Error>;
    void               remove(const Pid& pid);
    [[nodiscard]] auto add_dependencies(const Pid& pid, const std::vector<Pid>& dependencies)
      -> std::expected<void, Error>;

    void reset_run_state();
    void clear() { entries.clear(); }

    [[nodiscard]] auto find(const Pid& pid) const -> std::optional<std::size_t>;
    [[nodiscard]] auto contains(const Pid& pid) const -> bool { return find(pid).has_value(); }

    [[nodiscard]] auto size() const -> std::size_t { return entries.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries.empty(); }

    [[nodiscard]] auto process(const std::size_t idx) const -> const Process& { return entries[idx].process; }
    [[nodiscard]] auto state(const std::size_t idx) const -> const RunState& { return entries[idx].state; }
    [[nodiscard]] auto state(const std::size_t idx) -> RunState& { return entries[idx].state; }

    [[nodiscard]] auto all() const -> std::span<const Entry> { return entries; }
    [[nodiscard]] auto all_finished() const -> bool;

  private:
    std::vector<Entry> entries;
};

} // namespace Os
