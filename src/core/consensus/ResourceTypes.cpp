#include "core/consensus/ResourceTypes.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace qsynth {
namespace core {
namespace consensus {

namespace {

int64_t toMillis(WallClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

WallClock::time_point fromMillis(int64_t ms) {
    return WallClock::time_point(std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds(ms)));
}

// Большие числа передаются десятичными строками
mpz_class parseInteger(const nlohmann::json& j, const char* field) {
    const std::string text = j.at(field).get<std::string>();
    mpz_class result;
    if (result.set_str(text, 10) != 0) {
        throw std::invalid_argument(std::string("Некорректное целое в поле ") + field + ": " + text);
    }
    return result;
}

} // namespace

nlohmann::json AdaptationRecord::toJson() const {
    return {
        {"proposalId", proposalId},
        {"timestamp", toMillis(timestamp)},
        {"oldValue", oldValue.get_str()},
        {"newValue", newValue.get_str()},
        {"oldTier", crypto::toString(oldTier)},
        {"newTier", crypto::toString(newTier)},
        {"energyChange", energyChange},
        {"keyRotated", keyRotated},
        {"version", version}
    };
}

AdaptationRecord AdaptationRecord::fromJson(const nlohmann::json& j) {
    AdaptationRecord record;
    record.proposalId = j.at("proposalId").get<std::string>();
    record.timestamp = fromMillis(j.at("timestamp").get<int64_t>());
    record.oldValue = parseInteger(j, "oldValue");
    record.newValue = parseInteger(j, "newValue");
    record.oldTier = crypto::tierFromString(j.at("oldTier").get<std::string>());
    record.newTier = crypto::tierFromString(j.at("newTier").get<std::string>());
    record.energyChange = j.value("energyChange", 0.0);
    record.keyRotated = j.value("keyRotated", false);
    record.version = j.value("version", uint64_t{0});
    return record;
}

nlohmann::json ResourceHandle::toJson() const {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& record : adaptationHistory) {
        history.push_back(record.toJson());
    }
    return {
        {"id", id},
        {"value", value.get_str()},
        {"frequency", frequency.get_str()},
        {"complexityTier", crypto::toString(complexityTier)},
        {"keyMaterialRef", keyMaterialRef},
        {"adaptationHistory", history},
        {"replicaSet", replicaSet},
        {"consensusVersion", consensusVersion},
        {"locked", locked},
        {"lastAdaptation", toMillis(lastAdaptation)}
    };
}

ResourceHandle ResourceHandle::fromJson(const nlohmann::json& j) {
    ResourceHandle handle;
    handle.id = j.at("id").get<std::string>();
    handle.value = parseInteger(j, "value");
    handle.frequency = parseInteger(j, "frequency");
    handle.complexityTier = crypto::tierFromString(j.at("complexityTier").get<std::string>());
    handle.keyMaterialRef = j.at("keyMaterialRef").get<std::string>();
    for (const auto& record : j.value("adaptationHistory", nlohmann::json::array())) {
        handle.adaptationHistory.push_back(AdaptationRecord::fromJson(record));
    }
    handle.replicaSet = j.value("replicaSet", std::set<std::string>{});
    handle.consensusVersion = j.at("consensusVersion").get<uint64_t>();
    if (handle.consensusVersion == 0) {
        throw std::invalid_argument("consensusVersion должна быть не меньше 1");
    }
    handle.locked = j.value("locked", false);
    handle.lastAdaptation = fromMillis(j.value("lastAdaptation", int64_t{0}));
    return handle;
}

size_t Proposal::approvals() const {
    return static_cast<size_t>(std::count_if(votes.begin(), votes.end(),
        [](const auto& vote) { return vote.second; }));
}

nlohmann::json Proposal::toJson() const {
    return {
        {"id", id},
        {"resourceId", resourceId},
        {"proposerId", proposerId},
        {"newValue", newValue.get_str()},
        {"newFrequency", newFrequency.get_str()},
        {"metrics", {
            {"energyBefore", metrics.energyBefore.get_str()},
            {"energyAfter", metrics.energyAfter.get_str()},
            {"relativeChange", metrics.relativeChange}
        }},
        {"votes", votes},
        {"requiredVotes", requiredVotes},
        {"timeoutMs", std::chrono::duration_cast<std::chrono::milliseconds>(expiry - createdAt).count()}
    };
}

size_t requiredVotesFor(size_t replicaCount, double quorumRatio) {
    if (replicaCount == 0) {
        return 1;
    }
    // Доля кворума учитывается с точностью до сотых: 0.67 от 3 реплик дают 2 голоса
    double raw = std::ceil(static_cast<double>(replicaCount) * (quorumRatio - 0.005));
    size_t required = raw < 1.0 ? 1 : static_cast<size_t>(raw);
    return std::min(required, replicaCount);
}

std::string toString(AdaptationStatus status) {
    switch (status) {
        case AdaptationStatus::Committed: return "committed";
        case AdaptationStatus::NotRequired: return "not-required";
        case AdaptationStatus::Locked: return "locked";
        case AdaptationStatus::Rejected: return "rejected";
        case AdaptationStatus::TimedOut: return "timed-out";
        case AdaptationStatus::Failed: return "failed";
    }
    return "unknown";
}

nlohmann::json AdaptationOutcome::toJson() const {
    nlohmann::json j = {
        {"adapted", adapted},
        {"status", toString(status)},
        {"reason", reason}
    };
    if (newTier) j["newTier"] = crypto::toString(*newTier);
    if (newVersion) j["newVersion"] = *newVersion;
    if (!proposalId.empty()) j["proposalId"] = proposalId;
    return j;
}

nlohmann::json MigrationPackage::toJson() const {
    return {
        {"resource", resource.toJson()},
        {"sourceNodeId", sourceNodeId},
        {"targetNodeId", targetNodeId},
        {"migrationId", migrationId},
        {"timestamp", toMillis(timestamp)}
    };
}

MigrationPackage MigrationPackage::fromJson(const nlohmann::json& j) {
    MigrationPackage package;
    package.resource = ResourceHandle::fromJson(j.at("resource"));
    package.sourceNodeId = j.at("sourceNodeId").get<std::string>();
    package.targetNodeId = j.at("targetNodeId").get<std::string>();
    package.migrationId = j.at("migrationId").get<std::string>();
    package.timestamp = fromMillis(j.value("timestamp", int64_t{0}));
    return package;
}

nlohmann::json ResourceStats::toJson() const {
    return {
        {"id", id},
        {"currentValue", currentValue},
        {"adaptationCount", adaptationCount},
        {"lastAdaptation", lastAdaptationMs},
        {"currentComplexity", crypto::toString(currentTier)},
        {"replicationNodes", replicas},
        {"consensusVersion", consensusVersion},
        {"locked", locked}
    };
}

} // namespace consensus
} // namespace core
} // namespace qsynth
