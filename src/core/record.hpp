#pragma once
#include <string>
#include <vector>

#include "outcome.hpp"

namespace gwmon {
enum class ItemKind { GatewayProbe, SessionOpen, TargetProbe, SessionClose };

inline const char* kind_name(ItemKind k) {
    switch (k) {
        case ItemKind::GatewayProbe: return "VPN ping";
        case ItemKind::SessionOpen: return "VPN open";
        case ItemKind::TargetProbe: return "Target ping";
        case ItemKind::SessionClose: return "VPN close";
    }
    return "?";
}

struct CycleRecord {
    int cycle{};
    std::string date;
    std::string tod;
    ItemKind kind{};
    Outcome outcome{Outcome::Fail};
    std::string address;
    std::string label;
};

// cycle,date,time,kind,outcome,address,label
inline std::string to_csv_line(const CycleRecord& r) {
    std::string out = std::to_string(r.cycle);
    out += ',';
    out += r.date;
    out += ',';
    out += r.tod;
    out += ',';
    out += kind_name(r.kind);
    out += ',';
    out += outcome_name(r.outcome);
    out += ',';
    out += r.address;
    out += ',';
    out += r.label;
    out += '\n';
    return out;
}

class ResultSink {
   public:
    virtual ~ResultSink() = default;
    virtual Outcome write(const std::vector<CycleRecord>& rows) = 0;
    virtual void close() = 0;
};
}  // namespace gwmon
