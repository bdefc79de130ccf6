#include "types.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::optional<VoteValue> parse_vote_value(const std::string& text) {
    std::string v = util::to_lower(util::trim(text));
    if (v == "yea" || v == "yes" || v == "aye") return VoteValue::Yea;
    if (v == "nay" || v == "no") return VoteValue::Nay;
    if (v == "abstain" || v == "present") return VoteValue::Abstain;
    if (v == "absent" || v == "not voting") return VoteValue::Absent;
    return std::nullopt;
}

std::string vote_value_to_string(VoteValue value) {
    switch (value) {
        case VoteValue::Yea: return "yea";
        case VoteValue::Nay: return "nay";
        case VoteValue::Abstain: return "abstain";
        case VoteValue::Absent: return "absent";
    }
    return "absent";
}

std::string TimeWindow::label() const {
    return util::format_iso8601(start) + "/" + util::format_iso8601(end);
}

bool Member::active_in(const TimeWindow& window) const {
    if (active_from >= window.end) {
        return false;
    }
    return !active_to || *active_to > window.start;
}

Member Member::from_json(const nlohmann::json& j) {
    Member member;
    member.id = j.at("id").get<std::string>();
    member.name = j.value("name", "");
    if (j.contains("party") && !j.at("party").is_null()) {
        member.party = j.at("party").get<std::string>();
    }
    member.jurisdiction = j.value("jurisdiction", "");
    if (j.contains("active_from") && !j.at("active_from").is_null()) {
        member.active_from = util::parse_iso8601(j.at("active_from").get<std::string>());
    }
    if (j.contains("active_to") && !j.at("active_to").is_null()) {
        member.active_to = util::parse_iso8601(j.at("active_to").get<std::string>());
    }
    return member;
}

nlohmann::json Member::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"name", name},
        {"party", party ? nlohmann::json(*party) : nlohmann::json(nullptr)},
        {"jurisdiction", jurisdiction},
        {"active_from", util::format_iso8601(active_from)}
    };
    j["active_to"] = active_to ? nlohmann::json(util::format_iso8601(*active_to)) : nlohmann::json(nullptr);
    return j;
}

Document Document::from_json(const nlohmann::json& j) {
    Document doc;
    doc.id = j.at("id").get<std::string>();
    doc.primary_sponsor = j.at("primary_sponsor").get<std::string>();
    doc.cosponsors = j.value("cosponsors", std::vector<std::string>{});
    doc.text = j.at("text").get<std::string>();
    doc.timestamp = util::parse_iso8601(j.at("timestamp").get<std::string>());
    doc.topics = j.value("topics", std::vector<std::string>{});
    return doc;
}

Vote Vote::from_json(const nlohmann::json& j) {
    Vote vote;
    vote.roll_call_id = j.at("roll_call_id").get<std::string>();
    vote.timestamp = util::parse_iso8601(j.at("timestamp").get<std::string>());
    for (const auto& [member_id, value] : j.at("positions").items()) {
        auto parsed = parse_vote_value(value.get<std::string>());
        if (!parsed) {
            throw ValidationError("unknown vote value '" + value.get<std::string>() +
                                  "' for member " + member_id);
        }
        vote.positions[member_id] = *parsed;
    }
    if (j.contains("bill_id") && !j.at("bill_id").is_null()) {
        vote.bill_id = j.at("bill_id").get<std::string>();
    }
    return vote;
}

nlohmann::json SubScore::to_json() const {
    return {
        {"value", value},
        {"confidence", confidence}
    };
}

nlohmann::json AlignmentScore::to_json() const {
    return {
        {"member_id", member_id},
        {"axis", axis},
        {"window_start", util::format_iso8601(window.start)},
        {"window_end", util::format_iso8601(window.end)},
        {"value", value},
        {"confidence", confidence},
        {"label", label},
        {"components", {
            {"text", text.to_json()},
            {"coalition", coalition.to_json()},
            {"vote", vote.to_json()}
        }},
        {"computed_at", util::format_iso8601(computed_at)}
    };
}

namespace {

// Decodes each element of an array independently; a bad element is logged
// and counted instead of failing the batch.
template <typename T>
void decode_records(const nlohmann::json& j, const char* key, std::vector<T>& out, int& skipped) {
    if (!j.contains(key)) {
        return;
    }
    const auto& records = j.at(key);
    if (!records.is_array()) {
        throw ValidationError(std::string("'") + key + "' must be an array");
    }
    for (std::size_t i = 0; i < records.size(); ++i) {
        try {
            out.push_back(T::from_json(records[i]));
        } catch (const std::exception& e) {
            ++skipped;
            spdlog::warn("Skipping malformed {} record #{}: {}", key, i, e.what());
        }
    }
}

} // namespace

RecordBatch RecordBatch::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("record batch must be a JSON object");
    }

    RecordBatch batch;
    decode_records(j, "members", batch.members, batch.skipped_members);
    decode_records(j, "documents", batch.documents, batch.skipped_documents);
    decode_records(j, "votes", batch.votes, batch.skipped_votes);

    spdlog::info("Decoded record batch: {} members, {} documents, {} votes ({} skipped)",
                 batch.members.size(), batch.documents.size(), batch.votes.size(),
                 batch.skipped_members + batch.skipped_documents + batch.skipped_votes);
    return batch;
}
