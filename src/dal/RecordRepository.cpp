#include "dal/RecordRepository.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/RecordRules.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace dnscache::dal {

namespace {

int64_t toEpochMillis(common::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

common::TimePoint fromEpochMillis(int64_t iMillis) {
  return common::TimePoint(std::chrono::duration_cast<common::Clock::duration>(
      std::chrono::milliseconds(iMillis)));
}

std::optional<std::string> optionalText(const pqxx::field& fld) {
  if (fld.is_null()) return std::nullopt;
  return fld.as<std::string>();
}

}  // namespace

RecordRepository::RecordRepository(ConnectionPool& cpPool, common::ClockFn fnClock)
    : _cpPool(cpPool), _fnClock(std::move(fnClock)) {}
RecordRepository::~RecordRepository() = default;

void RecordRepository::ensureSchema() {
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    txn.exec(
        "CREATE TABLE IF NOT EXISTS entries ("
        "id BIGSERIAL PRIMARY KEY, "
        "address TEXT, "
        "host TEXT, "
        "priority INTEGER, "
        "domain VARCHAR(256) NOT NULL, "
        "expiration_date TIMESTAMPTZ NOT NULL, "
        "ttl INTEGER NOT NULL, "
        "record_type INTEGER NOT NULL)");
    txn.exec(
        "CREATE UNIQUE INDEX IF NOT EXISTS entries_key_idx ON entries "
        "(domain, record_type, (COALESCE(address, '')), (COALESCE(host, '')))");
    txn.exec(
        "CREATE INDEX IF NOT EXISTS entries_expiration_idx ON entries (expiration_date)");
    txn.commit();
  } catch (const pqxx::failure& ex) {
    throw common::StoreIOError("db_schema_failed",
                               std::string("Cannot create entries schema: ") + ex.what());
  }
}

int RecordRepository::upsert(const std::vector<common::ResourceRecord>& vRecords) {
  const auto tpNow = _fnClock();
  common::validateRecords(vRecords, tpNow);
  if (vRecords.empty()) return 0;

  std::vector<std::string> vDomains;
  vDomains.reserve(vRecords.size());
  for (const auto& rr : vRecords) {
    vDomains.push_back(common::normalizeDomain(rr.sDomain));
  }

  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    int iAffected = 0;
    for (std::size_t i = 0; i < vRecords.size(); ++i) {
      const auto& rr = vRecords[i];
      // Replacement rather than in-place update: the refreshed row takes a new id
      txn.exec(
          "DELETE FROM entries WHERE domain = $1 AND record_type = $2 "
          "AND COALESCE(address, '') = $3 AND COALESCE(host, '') = $4",
          pqxx::params{vDomains[i], static_cast<int>(rr.uRecordType),
                       rr.oAddress.value_or(""), rr.oHost.value_or("")});
      auto result = txn.exec(
          "INSERT INTO entries "
          "(address, host, priority, domain, expiration_date, ttl, record_type) "
          "VALUES ($1, $2, $3, $4, to_timestamp($5::double precision / 1000.0), $6, $7)",
          pqxx::params{rr.oAddress, rr.oHost, rr.iPriority, vDomains[i],
                       toEpochMillis(rr.tpExpiresAt), static_cast<int>(rr.durTtl.count()),
                       static_cast<int>(rr.uRecordType)});
      iAffected += static_cast<int>(result.affected_rows());
    }
    txn.commit();
    common::Logger::get()->debug("Record store: upserted {} rows for '{}'", iAffected,
                                 vDomains.front());
    return iAffected;
  } catch (const pqxx::failure& ex) {
    throw common::StoreIOError("db_upsert_failed",
                               std::string("Record upsert rolled back: ") + ex.what());
  }
}

std::vector<common::ResourceRecord> RecordRepository::query(const std::string& sDomain,
                                                            uint16_t uRecordType,
                                                            common::TimePoint tpNow) {
  const std::string sKey = common::normalizeDomain(sDomain);

  pqxx::result result;
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    result = txn.exec(
        "SELECT id, address, host, COALESCE(priority, 0), domain, "
        "(EXTRACT(EPOCH FROM expiration_date) * 1000)::bigint, ttl, record_type "
        "FROM entries "
        "WHERE domain = $1 AND record_type = $2 "
        "AND expiration_date > to_timestamp($3::double precision / 1000.0) "
        "ORDER BY COALESCE(priority, 0) ASC, id ASC",
        pqxx::params{sKey, static_cast<int>(uRecordType), toEpochMillis(tpNow)});
    txn.commit();
  } catch (const pqxx::failure& ex) {
    throw common::StoreIOError("db_query_failed",
                               std::string("Record query failed: ") + ex.what());
  }

  std::vector<common::ResourceRecord> vOut;
  vOut.reserve(result.size());
  for (const auto& row : result) {
    common::ResourceRecord rr;
    rr.iId = row[0].as<int64_t>();
    rr.oAddress = optionalText(row[1]);
    rr.oHost = optionalText(row[2]);
    rr.iPriority = row[3].as<int>();
    rr.sDomain = row[4].as<std::string>();
    rr.tpExpiresAt = fromEpochMillis(row[5].as<int64_t>());
    rr.durTtl = std::chrono::seconds(row[6].as<int>());
    rr.uRecordType = static_cast<uint16_t>(row[7].as<int>());
    vOut.push_back(std::move(rr));
  }
  return vOut;
}

int RecordRepository::pruneExpired(common::TimePoint tpNow) {
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec(
        "DELETE FROM entries WHERE expiration_date <= to_timestamp($1::double precision / 1000.0)",
        pqxx::params{toEpochMillis(tpNow)});
    txn.commit();
    return static_cast<int>(result.affected_rows());
  } catch (const pqxx::failure& ex) {
    throw common::StoreIOError("db_prune_failed",
                               std::string("Expired record prune failed: ") + ex.what());
  }
}

}  // namespace dnscache::dal
