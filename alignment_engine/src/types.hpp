#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

enum class VoteValue {
    Yea,
    Nay,
    Abstain,
    Absent
};

std::optional<VoteValue> parse_vote_value(const std::string& text);
std::string vote_value_to_string(VoteValue value);

// Half-open range [start, end)
struct TimeWindow {
    TimePoint start;
    TimePoint end;

    bool contains(const TimePoint& tp) const { return tp >= start && tp < end; }
    bool valid() const { return start < end; }
    std::string label() const;
};

struct Member {
    std::string id;
    std::string name;
    std::optional<std::string> party;
    std::string jurisdiction;
    TimePoint active_from;
    std::optional<TimePoint> active_to;

    bool active_in(const TimeWindow& window) const;

    static Member from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Bill text or floor-speech transcript
struct Document {
    std::string id;
    std::string primary_sponsor;
    std::vector<std::string> cosponsors;
    std::string text;
    TimePoint timestamp;
    std::vector<std::string> topics;

    static Document from_json(const nlohmann::json& j);
};

struct Vote {
    std::string roll_call_id;
    TimePoint timestamp;
    std::map<std::string, VoteValue> positions;
    std::optional<std::string> bill_id;

    static Vote from_json(const nlohmann::json& j);
};

struct SubScore {
    double value = 0.0;
    double confidence = 0.0;

    nlohmann::json to_json() const;
};

struct AlignmentScore {
    std::string member_id;
    std::string axis;
    TimeWindow window;
    double value = 0.0;
    double confidence = 0.0;
    SubScore text;
    SubScore coalition;
    SubScore vote;
    std::string label;
    TimePoint computed_at;

    nlohmann::json to_json() const;
};

// One input batch from the ingestion collaborator. Malformed records are
// dropped during decoding and counted, never fatal.
struct RecordBatch {
    std::vector<Member> members;
    std::vector<Document> documents;
    std::vector<Vote> votes;

    int skipped_members = 0;
    int skipped_documents = 0;
    int skipped_votes = 0;

    static RecordBatch from_json(const nlohmann::json& j);
};
