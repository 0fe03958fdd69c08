#pragma once

#include "exchange.hpp"
#include "ledger_types.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace wx {

// Decimal units <-> base units, no floating point. "10.5" -> 10'500'000'000.
Amount parseUnits(const std::string& text);
std::string formatUnits(Amount amount);

struct ScriptResult {
    std::size_t line = 0;
    bool ok = true;
    std::string command;
    std::string message;
};

// Line-oriented request language over a WeatherExchange. One request per
// line, whitespace separated, double quotes group a token, '#' starts a
// comment. Rejected requests produce ok == false and leave state unchanged.
class RequestScript {
public:
    explicit RequestScript(WeatherExchange& exchange, Timestamp start = 0);

    ScriptResult execute(const std::string& line, std::size_t lineNumber = 0);
    std::vector<ScriptResult> run(std::istream& in);

    Timestamp now() const { return now_; }

    static std::vector<std::string> tokenize(const std::string& line);

private:
    using Args = std::vector<std::string>;
    struct Command {
        std::size_t arity = 0;
        bool variadic = false;
        std::string usage;
        std::function<std::string(const Args&)> handler;
    };

    void registerCommands();
    void define(const std::string& name, std::size_t arity, std::string usage, std::function<std::string(const Args&)> handler);
    void defineVariadic(const std::string& name,
                        std::size_t minArity,
                        std::string usage,
                        std::function<std::string(const Args&)> handler);

    WeatherExchange& exchange_;
    Timestamp now_;
    std::map<std::string, Command> commands_;
};

} // namespace wx
