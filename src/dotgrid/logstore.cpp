// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/logstore.h>

#include <algorithm>
#include <iostream>

using std::string;
using std::string_view;

namespace dotgrid::logstore
{

namespace
{
    bool matches(string_view pattern, string_view name)
    {
        if (pattern.empty())
            return false;
        if (pattern.back() != '*')
            return name == pattern;
        pattern.remove_suffix(1);
        return name.substr(0, pattern.size()) == pattern;
    }

    std::vector<string_view> splitFilter(string_view text)
    {
        std::vector<string_view> result;
        for (;;)
        {
            auto const comma = text.find(',');
            result.emplace_back(text.substr(0, comma));
            if (comma == string_view::npos)
                return result;
            text.remove_prefix(comma + 1);
        }
    }
} // namespace

sink::sink(bool enabled, writer write): _enabled { enabled }, _writer { std::move(write) }
{
}

sink::sink(bool enabled, std::ostream& output):
    sink(enabled, [stream = &output](string_view line) { *stream << line << std::flush; })
{
}

sink& sink::console()
{
    static auto stdoutSink = sink(true, std::cout);
    return stdoutSink;
}

message_builder::message_builder(category const& owner, std::source_location location):
    _owner { owner }, _location { location }
{
}

message_builder::~message_builder()
{
    if (_owner.is_enabled())
        _owner.output().write(str());
}

string message_builder::str() const
{
    return fmt::format(
        "[{}:{}:{}]: {}\n", _owner.name(), _location.file_name(), _location.line(), _text);
}

category::category(string_view name, string_view description, state initialState, visibility initialVisibility):
    _name { name },
    _description { description },
    _enabled { initialState == state::Enabled },
    _visible { initialVisibility == visibility::Public },
    _sink { &sink::console() }
{
    categories().push_back(this);
}

category::~category()
{
    auto& all = categories();
    all.erase(std::remove(all.begin(), all.end(), this), all.end());
}

std::vector<category*>& categories()
{
    static std::vector<category*> registry;
    return registry;
}

category* get(string_view name)
{
    auto& all = categories();
    auto const i = std::find_if(all.begin(), all.end(), [&](category* c) { return c->name() == name; });
    return i != all.end() ? *i : nullptr;
}

void set_sink(sink& target)
{
    for (auto* c: categories())
        c->set_sink(target);
}

void configure(string_view filter)
{
    auto const patterns = splitFilter(filter);
    auto const enableAll = filter == "all";

    for (auto* c: categories())
    {
        if (c == &ErrorLog)
            continue;
        c->enable(enableAll || std::any_of(patterns.begin(), patterns.end(), [c](string_view pattern) {
                      return matches(pattern, c->name());
                  }));
    }
}

} // namespace dotgrid::logstore
