#include "backup/retention_policy.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <set>

RetentionDecision computeRetention(std::vector<BackupMetadata> backups,
                                   const RetentionPolicy& policy,
                                   TimePoint now) {
    using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

    std::stable_sort(backups.begin(), backups.end(),
                     [](const BackupMetadata& a, const BackupMetadata& b) {
                         return a.startTime > b.startTime;
                     });

    const TimePoint dailyCutoff = now - Days(policy.dailyRetentionDays);
    const TimePoint weeklyCutoff = now - Days(policy.weeklyRetentionWeeks * 7);
    const TimePoint monthlyCutoff = now - Days(policy.monthlyRetentionMonths * 30);

    std::set<std::string> keep;
    std::set<std::string> seenWeeks;
    std::set<std::string> seenMonths;

    for (const auto& backup : backups) {
        const TimePoint start = backup.startTime;
        if (start >= dailyCutoff) {
            keep.insert(backup.id);
        } else if (start >= weeklyCutoff) {
            if (seenWeeks.insert(utils::isoWeekKey(start)).second) {
                keep.insert(backup.id);
            }
        } else if (start >= monthlyCutoff) {
            if (seenMonths.insert(utils::monthKey(start)).second) {
                keep.insert(backup.id);
            }
        }
    }

    RetentionDecision decision;
    const size_t limit = policy.maxBackups > 0 ? static_cast<size_t>(policy.maxBackups) : 0;
    for (const auto& backup : backups) {
        if (keep.count(backup.id) && decision.keep.size() < limit) {
            decision.keep.push_back(backup.id);
        } else {
            decision.remove.push_back(backup.id);
        }
    }
    return decision;
}
