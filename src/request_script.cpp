#include "request_script.hpp"

#include "errors.hpp"

#include <istream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace wx {

namespace {

constexpr std::size_t kUnitDecimals = 9;

std::uint64_t parseU64(const std::string& text, const char* what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError(std::string(what) + " must be an unsigned integer, got '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ValidationError(std::string(what) + " out of range: '" + text + "'");
    }
}

std::int64_t parseI64(const std::string& text, const char* what) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed, 10);
    } catch (const std::invalid_argument&) {
        throw ValidationError(std::string(what) + " must be an integer, got '" + text + "'");
    } catch (const std::out_of_range&) {
        throw ValidationError(std::string(what) + " out of range: '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ValidationError(std::string(what) + " must be an integer, got '" + text + "'");
    }
    return static_cast<std::int64_t>(value);
}

std::uint32_t parseU32(const std::string& text, const char* what) {
    std::uint64_t value = parseU64(text, what);
    if (value > 0xffffffffULL) {
        throw ValidationError(std::string(what) + " out of range: '" + text + "'");
    }
    return static_cast<std::uint32_t>(value);
}

// Accepts "7" or "m7".
std::uint64_t parseMarketId(const std::string& text) {
    if (!text.empty() && text[0] == 'm') {
        return parseU64(text.substr(1), "market id");
    }
    return parseU64(text, "market id");
}

Side parseSide(const std::string& text) {
    if (text == "yes" || text == "long") {
        return Side::Yes;
    }
    if (text == "no" || text == "short") {
        return Side::No;
    }
    throw ValidationError("side must be yes/no or long/short, got '" + text + "'");
}

bool parseRuling(const std::string& text) {
    if (text == "uphold" || text == "upheld" || text == "yes" || text == "true") {
        return true;
    }
    if (text == "reject" || text == "rejected" || text == "no" || text == "false") {
        return false;
    }
    throw ValidationError("ruling must be uphold or reject, got '" + text + "'");
}

bool parseSwitch(const std::string& text) {
    if (text == "on" || text == "true") {
        return true;
    }
    if (text == "off" || text == "false") {
        return false;
    }
    throw ValidationError("expected on or off, got '" + text + "'");
}

ReportKey parseKey(const std::string& location, const std::string& date) {
    return ReportKey{ parseU64(location, "location id"), parseU64(date, "date key") };
}

std::string describeStats(std::uint64_t marketId, const PredictionMarket& market) {
    const MarketStats stats = market.getStats();
    std::ostringstream oss;
    oss << "market " << marketId << " " << marketTypeName(market.params().type)
        << " status=" << marketStatusName(stats.status) << (stats.paused ? " paused" : "")
        << " pool=" << formatUnits(stats.totalPool) << " pools=";
    for (std::size_t i = 0; i < stats.pools.size(); ++i) {
        oss << (i == 0 ? "" : "/") << formatUnits(stats.pools[i]);
    }
    oss << " participants=" << stats.participants << " paid=" << formatUnits(stats.paidOut)
        << " fees=" << formatUnits(stats.feesCollected) << " dust=" << formatUnits(stats.dustSwept);
    const SettlementRecord& record = market.settlement();
    if (record.settled) {
        oss << " value=" << record.settlementValue << " revision=" << record.reportRevision
            << (record.voided ? " voided" : "");
    }
    return oss.str();
}

} // namespace

Amount parseUnits(const std::string& text) {
    const auto dot = text.find('.');
    const std::string whole = text.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : text.substr(dot + 1);
    if (whole.empty() && fraction.empty()) {
        throw ValidationError("amount must not be empty");
    }
    if (fraction.size() > kUnitDecimals) {
        throw ValidationError("amount '" + text + "' has more than 9 decimals");
    }
    if (fraction.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError("amount '" + text + "' is not a decimal number");
    }
    const Amount units = whole.empty() ? 0 : parseU64(whole, "amount");
    fraction.append(kUnitDecimals - fraction.size(), '0');
    const Amount nanos = parseU64(fraction, "amount");
    if (units > (std::numeric_limits<Amount>::max() - nanos) / kUnit) {
        throw ValidationError("amount '" + text + "' out of range");
    }
    return units * kUnit + nanos;
}

std::string formatUnits(Amount amount) {
    std::string out = std::to_string(amount / kUnit);
    Amount nanos = amount % kUnit;
    if (nanos == 0) {
        return out;
    }
    std::string fraction = std::to_string(nanos);
    fraction.insert(0, kUnitDecimals - fraction.size(), '0');
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    return out + "." + fraction;
}

std::vector<std::string> RequestScript::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;
    for (char ch : line) {
        if (inQuotes) {
            if (ch == '"') {
                inQuotes = false;
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '"') {
            inQuotes = true;
            hasToken = true;
        } else if (ch == '#' && !hasToken) {
            break;
        } else if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
            if (hasToken) {
                tokens.push_back(current);
                current.clear();
                hasToken = false;
            }
        } else {
            current.push_back(ch);
            hasToken = true;
        }
    }
    if (inQuotes) {
        throw ValidationError("unterminated quote");
    }
    if (hasToken) {
        tokens.push_back(current);
    }
    return tokens;
}

RequestScript::RequestScript(WeatherExchange& exchange, Timestamp start)
    : exchange_(exchange)
    , now_(start) {
    registerCommands();
}

void RequestScript::define(const std::string& name,
                           std::size_t arity,
                           std::string usage,
                           std::function<std::string(const Args&)> handler) {
    commands_[name] = Command{ arity, false, std::move(usage), std::move(handler) };
}

void RequestScript::defineVariadic(const std::string& name,
                                   std::size_t minArity,
                                   std::string usage,
                                   std::function<std::string(const Args&)> handler) {
    commands_[name] = Command{ minArity, true, std::move(usage), std::move(handler) };
}

ScriptResult RequestScript::execute(const std::string& line, std::size_t lineNumber) {
    ScriptResult result;
    result.line = lineNumber;
    try {
        Args tokens = tokenize(line);
        if (tokens.empty()) {
            return result;
        }
        result.command = tokens.front();
        auto it = commands_.find(result.command);
        if (it == commands_.end()) {
            throw ValidationError("unknown command '" + result.command + "'");
        }
        const Command& command = it->second;
        Args args(tokens.begin() + 1, tokens.end());
        if (args.size() < command.arity || (!command.variadic && args.size() != command.arity)) {
            throw ValidationError("usage: " + result.command + " " + command.usage);
        }
        result.message = command.handler(args);
    } catch (const LedgerError& ex) {
        result.ok = false;
        result.message = ex.what();
    } catch (const std::overflow_error& ex) {
        result.ok = false;
        result.message = ex.what();
    }
    return result;
}

std::vector<ScriptResult> RequestScript::run(std::istream& in) {
    std::vector<ScriptResult> results;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        ScriptResult result = execute(line, lineNumber);
        if (!result.command.empty() || !result.ok) {
            results.push_back(std::move(result));
        }
    }
    return results;
}

void RequestScript::registerCommands() {
    define("at", 1, "<timestamp>", [this](const Args& a) {
        now_ = parseU64(a[0], "timestamp");
        return "now " + std::to_string(now_);
    });
    define("advance", 1, "<seconds>", [this](const Args& a) {
        const std::uint64_t seconds = parseU64(a[0], "seconds");
        if (seconds > std::numeric_limits<Timestamp>::max() - now_) {
            throw ValidationError("clock overflow");
        }
        now_ += seconds;
        return "now " + std::to_string(now_);
    });

    define("add-reporter", 4, "<caller> <reporter> <name> <source-type>", [this](const Args& a) {
        exchange_.addReporter(a[0], a[1], a[2], a[3], now_);
        return "reporter " + a[1] + " added";
    });
    define("remove-reporter", 2, "<caller> <reporter>", [this](const Args& a) {
        exchange_.removeReporter(a[0], a[1], now_);
        return "reporter " + a[1] + " removed";
    });
    define("add-arbitrator", 4, "<caller> <arbitrator> <name> <weight>", [this](const Args& a) {
        exchange_.addArbitrator(a[0], a[1], a[2], parseU32(a[3], "weight"), now_);
        return "arbitrator " + a[1] + " added";
    });
    define("remove-arbitrator", 2, "<caller> <arbitrator>", [this](const Args& a) {
        exchange_.removeArbitrator(a[0], a[1], now_);
        return "arbitrator " + a[1] + " removed";
    });

    define("report",
           14,
           "<reporter> <location> <date> <temp> <temp-max> <temp-min> <precip> <visibility> <wind> <gust> "
           "<pressure> <humidity> <conditions> <source-hash>",
           [this](const Args& a) {
               WeatherReading reading;
               reading.temperature = parseI64(a[3], "temperature");
               reading.temperatureMax = parseI64(a[4], "temperature max");
               reading.temperatureMin = parseI64(a[5], "temperature min");
               reading.precipitation = parseI64(a[6], "precipitation");
               reading.visibility = parseI64(a[7], "visibility");
               reading.windSpeed = parseI64(a[8], "wind speed");
               reading.windGust = parseI64(a[9], "wind gust");
               reading.pressure = parseI64(a[10], "pressure");
               reading.humidity = parseI64(a[11], "humidity");
               auto condition = parseCondition(a[12]);
               if (!condition) {
                   throw ValidationError("unknown conditions '" + a[12] + "'");
               }
               reading.conditions = *condition;
               reading.sourceHash = a[13];
               const ReportKey key = parseKey(a[1], a[2]);
               bool finalized = exchange_.submitReport(a[0], key, reading, now_);
               return "report " + key.describe() + (finalized ? " finalized" : " pending");
           });

    define("dispute", 5, "<disputer> <location> <date> <stake> <evidence>", [this](const Args& a) {
        const ReportKey key = parseKey(a[1], a[2]);
        std::uint64_t id = exchange_.disputeResolution(a[0], key, a[4], parseUnits(a[3]), now_);
        return "dispute " + std::to_string(id) + " open on " + key.describe();
    });
    define("escalate", 4, "<disputer> <dispute-id> <stake> <evidence>", [this](const Args& a) {
        const std::uint64_t id = parseU64(a[1], "dispute id");
        exchange_.escalateDispute(a[0], id, a[3], parseUnits(a[2]), now_);
        return "dispute " + std::to_string(id) + " escalated";
    });
    define("vote", 4, "<arbitrator> <dispute-id> <uphold|reject> <reason>", [this](const Args& a) {
        const std::uint64_t id = parseU64(a[1], "dispute id");
        exchange_.arbitratorVote(a[0], id, parseRuling(a[2]), a[3], now_);
        return "vote recorded on dispute " + std::to_string(id);
    });
    define("resolve",
           6,
           "<arbitrator> <dispute-id> <uphold|reject> <new-outcome yes|no> <new-value> <reason>",
           [this](const Args& a) {
               const std::uint64_t id = parseU64(a[1], "dispute id");
               DisputeSettlement settlement = exchange_.resolveDispute(
                   a[0], id, parseRuling(a[2]), parseSide(a[3]) == Side::Yes, parseI64(a[4], "new value"), a[5], now_);
               return "dispute " + std::to_string(id) + (settlement.upheld ? " upheld" : " rejected") + ", " +
                      formatUnits(settlement.amount) + " to " + settlement.recipient;
           });

    defineVariadic("create-market",
                   7,
                   "<creator> <binary|bracket|scalar> <location> <date> <expiry> <criteria> <description> [oracle]",
                   [this](const Args& a) {
                       if (a.size() > 8) {
                           throw ValidationError("create-market takes at most 8 arguments");
                       }
                       MarketRequest request;
                       auto type = parseMarketType(a[1]);
                       if (!type) {
                           throw ValidationError("unknown market type '" + a[1] + "'");
                       }
                       request.type = *type;
                       request.locationId = parseU64(a[2], "location id");
                       request.dateKey = parseU64(a[3], "date key");
                       request.expiry = parseU64(a[4], "expiry");
                       request.criteria = a[5];
                       request.description = a[6];
                       if (a.size() == 8) {
                           request.oracle = a[7];
                       }
                       std::uint64_t id = exchange_.createMarket(a[0], request, now_);
                       return "market " + std::to_string(id) + " created";
                   });
    define("init-positions", 2, "<caller> <market>", [this](const Args& a) {
        exchange_.initPositionLedgers(a[0], parseMarketId(a[1]), now_);
        return std::string("position ledgers ready");
    });
    define("bet", 5, "<market> <bettor> <yes|no|long|short> <bracket> <amount>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[0]);
        const Amount amount = parseUnits(a[4]);
        exchange_.placeBet(a[1], id, parseSide(a[2]), parseU64(a[3], "bracket"), amount, now_);
        return "bet " + formatUnits(amount) + " on market " + std::to_string(id);
    });
    define("settle", 6, "<oracle> <market> <yes|no> <bracket> <value> <data-hash>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[1]);
        exchange_.settleMarket(a[0],
                               id,
                               parseSide(a[2]) == Side::Yes,
                               parseU64(a[3], "bracket"),
                               parseI64(a[4], "value"),
                               a[5],
                               now_);
        return "market " + std::to_string(id) + " settled";
    });
    define("settle-report", 2, "<caller> <market>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[1]);
        MarketStatus status = exchange_.settleFromReport(a[0], id, now_);
        return "market " + std::to_string(id) + " " + marketStatusName(status);
    });
    define("request-resolution", 2, "<caller> <market>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[1]);
        MarketStatus status = exchange_.requestResolution(a[0], id, now_);
        return "market " + std::to_string(id) + " " + marketStatusName(status);
    });
    define("flag-disputed", 2, "<oracle> <market>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[1]);
        exchange_.flagDisputed(a[0], id, now_);
        return "market " + std::to_string(id) + " disputed";
    });
    define("cancel-market", 2, "<caller> <market>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[1]);
        exchange_.cancelMarket(a[0], id, now_);
        return "market " + std::to_string(id) + " cancelled";
    });
    define("claim", 2, "<market> <bettor>", [this](const Args& a) {
        ClaimResult result = exchange_.claimWinnings(a[1], parseMarketId(a[0]), now_);
        return a[1] + " paid " + formatUnits(result.payout);
    });
    define("redeem", 4, "<market> <holder> <outcome> <amount>", [this](const Args& a) {
        Amount value =
            exchange_.redeemPositions(a[1], parseMarketId(a[0]), parseU64(a[2], "outcome"), parseUnits(a[3]), now_);
        return a[1] + " redeemed for " + formatUnits(value);
    });
    define("transfer", 5, "<market> <from> <to> <outcome> <amount>", [this](const Args& a) {
        const Amount amount = parseUnits(a[4]);
        exchange_.transferPosition(a[1], a[2], parseMarketId(a[0]), parseU64(a[3], "outcome"), amount, now_);
        return formatUnits(amount) + " moved from " + a[1] + " to " + a[2];
    });
    define("collect-fees", 2, "<caller> <market>", [this](const Args& a) {
        FeeCollection fees = exchange_.collectFees(a[0], parseMarketId(a[1]), now_);
        return "creator " + formatUnits(fees.creatorAmount) + " platform " + formatUnits(fees.platformAmount);
    });
    define("sweep-dust", 2, "<caller> <market>", [this](const Args& a) {
        Amount dust = exchange_.sweepDust(a[0], parseMarketId(a[1]), now_);
        return "swept " + formatUnits(dust);
    });
    define("order", 7, "<market> <owner> <order-id> <yes|no> <price-bps> <amount> <expiry>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[0]);
        const std::uint64_t orderId = parseU64(a[2], "order id");
        exchange_.placeLimitOrder(a[1],
                                  id,
                                  orderId,
                                  parseSide(a[3]),
                                  parseU32(a[4], "price"),
                                  parseUnits(a[5]),
                                  parseU64(a[6], "expiry"),
                                  now_);
        return "order " + std::to_string(orderId) + " resting";
    });
    define("cancel-order", 3, "<market> <owner> <order-id>", [this](const Args& a) {
        const std::uint64_t orderId = parseU64(a[2], "order id");
        Amount refund = exchange_.cancelLimitOrder(a[1], parseMarketId(a[0]), orderId, now_);
        return "order " + std::to_string(orderId) + " refunded " + formatUnits(refund);
    });
    define("pause", 2, "<caller> <market>", [this](const Args& a) {
        exchange_.pauseMarket(a[0], parseMarketId(a[1]), now_);
        return std::string("market paused");
    });
    define("unpause", 2, "<caller> <market>", [this](const Args& a) {
        exchange_.unpauseMarket(a[0], parseMarketId(a[1]), now_);
        return std::string("market unpaused");
    });
    define("pause-factory", 2, "<caller> <on|off>", [this](const Args& a) {
        const bool paused = parseSwitch(a[1]);
        exchange_.pauseFactory(a[0], paused, now_);
        return std::string(paused ? "factory paused" : "factory running");
    });

    define("show-report", 2, "<location> <date>", [this](const Args& a) {
        const ReportKey key = parseKey(a[0], a[1]);
        const WeatherReport* report = exchange_.getReport(key);
        if (report == nullptr) {
            return "report " + key.describe() + " none";
        }
        std::ostringstream oss;
        oss << "report " << key.describe() << " submissions=" << report->submissions.size();
        if (report->finalized) {
            oss << " finalized temperature=" << report->aggregate.temperature
                << " conditions=" << conditionName(report->aggregate.conditions) << " revision=" << report->revision;
        } else {
            oss << " pending";
        }
        if (exchange_.hasActiveDispute(key)) {
            oss << " disputed";
        }
        return oss.str();
    });
    define("show-dispute", 1, "<dispute-id>", [this](const Args& a) {
        const std::uint64_t id = parseU64(a[0], "dispute id");
        const Dispute* dispute = exchange_.getDispute(id);
        if (dispute == nullptr) {
            return "dispute " + std::to_string(id) + " none";
        }
        std::ostringstream oss;
        oss << "dispute " << id << " " << disputeStatusName(dispute->status) << " key=" << dispute->key.describe()
            << " stake=" << formatUnits(dispute->stake) << " votes=" << dispute->votes.size()
            << " upheld=" << dispute->upheldWeight << " rejected=" << dispute->rejectedWeight;
        return oss.str();
    });
    define("show-market", 1, "<market>", [this](const Args& a) {
        const std::uint64_t id = parseMarketId(a[0]);
        return describeStats(id, exchange_.market(id));
    });
    define("show-book", 1, "<market>", [this](const Args& a) {
        const OrderBookSnapshot book = exchange_.getOrderBook(parseMarketId(a[0]));
        std::ostringstream oss;
        oss << "book yes=" << book.bestYesBid << " no=" << book.bestNoBid << " active=" << book.activeOrderCount
            << " yesVolume=" << formatUnits(book.totalYesBidVolume) << " noVolume=" << formatUnits(book.totalNoBidVolume)
            << " escrow=" << formatUnits(book.escrowHeld);
        return oss.str();
    });
    define("show-order", 2, "<market> <order-id>", [this](const Args& a) {
        const std::uint64_t orderId = parseU64(a[1], "order id");
        auto order = exchange_.getOrder(parseMarketId(a[0]), orderId);
        if (!order) {
            return "order " + std::to_string(orderId) + " none";
        }
        std::ostringstream oss;
        oss << "order " << orderId << " " << orderStatusName(order->status) << " " << sideName(order->side) << " @"
            << order->price << " " << formatUnits(order->amount);
        return oss.str();
    });
    define("show-positions", 2, "<market> <holder>", [this](const Args& a) {
        std::ostringstream oss;
        oss << "positions " << a[1];
        for (const PositionInfo& info : exchange_.getPositionInfo(parseMarketId(a[0]), a[1])) {
            oss << " [" << info.outcome << "] " << formatUnits(info.balance);
            if (info.settled) {
                oss << "->" << formatUnits(info.redeemable);
            }
        }
        return oss.str();
    });
    define("show-journal", 0, "", [this](const Args&) {
        return "journal entries=" + std::to_string(exchange_.audit().size()) + " root=" + exchange_.journalRoot();
    });
}

} // namespace wx
