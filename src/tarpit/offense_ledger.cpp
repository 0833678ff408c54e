// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tarpit/offense_ledger.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace deadlock {
namespace tarpit {

std::string OffenseLedger::NormalizeKey(const std::string& address) {
  // Non-IP keys (e.g. "unknown" when the endpoint could not be read) are
  // kept verbatim so they still get counted
  auto normalized = util::ValidateAndNormalizeIP(address);
  return normalized ? *normalized : address;
}

OffenseRecord OffenseLedger::Record(const std::string& address, int64_t now) {
  const std::string key = NormalizeKey(address);

  OffenseRecord updated = records_.Upsert(key, [now](OffenseRecord& rec) {
    if (rec.connection_count == 0) {
      rec.first_seen = now;
    }
    ++rec.connection_count;
    rec.last_seen = now;
    return rec;
  });

  total_connections_.fetch_add(1, std::memory_order_relaxed);
  return updated;
}

OffenseRecord OffenseLedger::Record(const std::string& address) {
  return Record(address, util::GetTime());
}

std::optional<OffenseRecord> OffenseLedger::Get(const std::string& address) const {
  std::optional<OffenseRecord> result;
  records_.Read(NormalizeKey(address),
                [&](const OffenseRecord& rec) { result = rec; });
  return result;
}

std::vector<OffenseLedger::Entry> OffenseLedger::Snapshot() const {
  std::vector<Entry> entries = records_.GetAll();
  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
    if (a.second.connection_count != b.second.connection_count) {
      return a.second.connection_count > b.second.connection_count;
    }
    return a.first < b.first;
  });
  return entries;
}

std::vector<OffenseLedger::Entry> OffenseLedger::TopOffenders(size_t n) const {
  std::vector<Entry> entries = Snapshot();
  if (entries.size() > n) {
    entries.resize(n);
  }
  return entries;
}

size_t OffenseLedger::Size() const { return records_.Size(); }

size_t OffenseLedger::SweepStale(int64_t now, int64_t max_age_seconds) {
  if (max_age_seconds <= 0) {
    return 0;
  }

  const int64_t cutoff = now - max_age_seconds;
  size_t evicted = records_.EraseIf(
      [cutoff](const std::string&, const OffenseRecord& rec) {
        return rec.last_seen < cutoff;
      });

  if (evicted > 0) {
    LOG_TARPIT_DEBUG("OffenseLedger: evicted {} addresses unseen since {}",
                     evicted, util::FormatTime(cutoff));
  }
  return evicted;
}

void OffenseLedger::Clear() { records_.Clear(); }

} // namespace tarpit
} // namespace deadlock
