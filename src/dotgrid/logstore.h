// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <functional>
#include <iosfwd>
#include <iterator>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace dotgrid::logstore
{

class category;

/// Destination of finished log lines, such as the console or a capture buffer.
class sink
{
  public:
    using writer = std::function<void(std::string_view)>;

    sink(bool enabled, writer write);
    sink(bool enabled, std::ostream& output);

    void write(std::string_view line) const
    {
        if (_enabled)
            _writer(line);
    }

    /// Standard logging sink (stdout).
    static sink& console();

  private:
    bool _enabled;
    writer _writer;
};

/// Accumulates one message and flushes it to the owning category's sink when destroyed.
class message_builder
{
  public:
    message_builder(category const& owner, std::source_location location);
    ~message_builder();

    message_builder(message_builder const&) = delete;
    message_builder& operator=(message_builder const&) = delete;

    template <typename... T>
    message_builder& operator()(fmt::format_string<T...> format, T&&... args)
    {
        fmt::format_to(std::back_inserter(_text), format, std::forward<T>(args)...);
        return *this;
    }

    [[nodiscard]] std::string const& text() const noexcept { return _text; }

    /// The line handed to the sink: "[category:file:line]: text".
    [[nodiscard]] std::string str() const;

  private:
    category const& _owner;
    std::source_location _location;
    std::string _text;
};

/// A named log category that can be switched on and off, such as dotgrid.canvas.
///
/// Every category adds itself to a process-wide registry on construction,
/// so that configure() can address it by name.
class category
{
  public:
    enum class state
    {
        Enabled,
        Disabled
    };

    enum class visibility
    {
        Public,
        Hidden
    };

    category(std::string_view name,
             std::string_view description,
             state initialState = state::Disabled,
             visibility initialVisibility = visibility::Public);
    ~category();

    category(category const&) = delete;
    category& operator=(category const&) = delete;

    [[nodiscard]] std::string_view name() const noexcept { return _name; }
    [[nodiscard]] std::string_view description() const noexcept { return _description; }
    [[nodiscard]] bool visible() const noexcept { return _visible; }

    [[nodiscard]] bool is_enabled() const noexcept { return _enabled; }
    operator bool() const noexcept { return _enabled; }
    void enable(bool enabled = true) noexcept { _enabled = enabled; }

    void set_sink(logstore::sink& target) noexcept { _sink = &target; }
    [[nodiscard]] logstore::sink const& output() const noexcept { return *_sink; }

    [[nodiscard]] message_builder operator()(
        std::source_location location = std::source_location::current()) const
    {
        return message_builder(*this, location);
    }

  private:
    std::string_view _name;
    std::string_view _description;
    bool _enabled;
    bool _visible;
    logstore::sink* _sink;
};

/// All categories currently alive.
std::vector<category*>& categories();

/// Looks up a category by name, or returns nullptr.
category* get(std::string_view name);

/// Routes every registered category into the given sink.
void set_sink(sink& target);

/// Enables categories by a filter string.
///
/// The filter is either "all" or a comma separated list of category names,
/// where a trailing '*' matches every category with that prefix.
/// Categories not matched are disabled, except for the error category.
void configure(std::string_view filter);

auto inline ErrorLog = category("error", "Error Logger", category::state::Enabled);

} // namespace dotgrid::logstore
