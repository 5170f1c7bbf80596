#include <zkaffinity/schema/encoding/scale/attestation.hpp>
#include <zkaffinity/schema/key/attestation.hpp>
#include <zkaffinity/store/attestation_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <utility>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::store {

namespace {

using encoder_t = zkaffinity::schema::encoding::encoder<
    zkaffinity::schema::encoding::scale_encoder_tag>;
using zkaffinity::schema::encoding::scale::attestation_row_t;

constexpr auto kEmptyAddress = address_t{};
constexpr auto kEmptySignature = recoverable_signature_t{};

status_t validate(const attestation_t& record) {
  if (record.nonce.empty() || record.publisher.empty() ||
      record.timestamp == 0 || record.signature == kEmptySignature) {
    return make_error(error_code::validation_error,
                      "Missing required attestation fields");
  }
  if (!try_tag_from_id(tag_id(record.tag))) {
    return make_error(error_code::validation_error, "Unsupported tag");
  }
  if (record.subject_wallet == kEmptyAddress) {
    return make_error(error_code::validation_error,
                      "Invalid wallet address format");
  }
  if (record.score > kMaxAttestationScore) {
    return make_error(error_code::validation_error,
                      "Score exceeds the maximum of " +
                          std::to_string(kMaxAttestationScore));
  }
  return std::nullopt;
}

bytes_t encode_record(const attestation_t& record) {
  auto encoder = encoder_t{};
  return encoder.encode(zkaffinity::schema::encoding::scale::to_row(record));
}

result_t<attestation_t> decode_record(const bytes_t& value) {
  auto encoder = encoder_t{};
  auto row = encoder.try_decode<attestation_row_t>(make_bytes_view(value));
  if (!row) {
    return make_error(error_code::database_error,
                      "Stored attestation failed to decode");
  }
  auto record = zkaffinity::schema::encoding::scale::from_row(*row);
  if (!record) {
    return make_error(error_code::database_error,
                      "Stored attestation has an unknown layout");
  }
  return *record;
}

bool newest_first(const attestation_t& lhs, const attestation_t& rhs) {
  if (lhs.timestamp != rhs.timestamp) {
    return lhs.timestamp > rhs.timestamp;
  }
  return lhs.id > rhs.id;
}

// Resolves the ids behind an index prefix into records, newest first.
template <typename View>
result_t<std::vector<attestation_t>> load_indexed(
    const View& view,
    const bytes_t& prefix,
    const std::string_view index_name,
    const std::optional<tag_t> tag_filter) {
  auto index = view.list_by_prefix(prefix);
  if (has_error(index)) {
    return get_error(index);
  }

  auto out = std::vector<attestation_t>{};
  for (const auto& [index_key, unused] : get_value(index)) {
    auto id = key::read_trailing_id(make_bytes_view(index_key));
    if (!id) {
      continue;
    }
    auto raw = view.get(key::make_attestation_key(*id));
    if (has_error(raw)) {
      return get_error(raw);
    }
    if (!get_value(raw)) {
      spdlog::warn("{} index points at missing attestation {}", index_name,
                   *id);
      continue;
    }
    auto record = decode_record(*get_value(raw));
    if (has_error(record)) {
      return get_error(record);
    }
    if (tag_filter && get_value(record).tag != *tag_filter) {
      continue;
    }
    out.push_back(std::move(get_value(record)));
  }

  std::ranges::sort(out, newest_first);
  return out;
}

result_t<tag_t> parse_tag_filter(const std::string_view tag) {
  auto parsed = try_parse_tag(tag);
  if (!parsed) {
    return make_error(error_code::validation_error,
                      "Unsupported tag: " + std::string{tag} + " (expected " +
                          join_names(kTagNames) + ")");
  }
  return *parsed;
}

}  // namespace

attestation_store::attestation_store(storage_t storage)
    : storage_{std::move(storage)} {}

result_t<attestation_id_t> attestation_store::next_id() const {
  auto encoder = encoder_t{};
  auto stored = storage_.get<attestation_id_t>(encoder, key::make_next_id_key());
  if (has_error(stored)) {
    return get_error(stored);
  }
  return get_value(stored).value_or(attestation_id_t{1});
}

result_t<attestation_id_t> attestation_store::store_attestation(
    const attestation_t& record) {
  if (auto invalid = validate(record)) {
    spdlog::warn("Rejected attestation: {}", invalid->message);
    return *invalid;
  }

  auto lock = std::scoped_lock{write_mutex_};

  auto nonce_key = key::make_nonce_key(record.nonce);
  auto existing = storage_.get(nonce_key);
  if (has_error(existing)) {
    return get_error(existing);
  }
  if (get_value(existing).has_value()) {
    spdlog::warn("Duplicate attestation nonce {}", record.nonce);
    return make_error(error_code::duplicate_error,
                      "Attestation nonce already exists");
  }

  auto id = next_id();
  if (has_error(id)) {
    return get_error(id);
  }

  auto stored = record;
  stored.id = get_value(id);
  stored.consumed = false;

  auto encoder = encoder_t{};
  auto batch = zkaffinity::storage::write_batch{};
  batch.puts.emplace_back(key::make_attestation_key(stored.id),
                          encode_record(stored));
  batch.puts.emplace_back(nonce_key, encoder.encode(stored.id));
  batch.puts.emplace_back(key::make_wallet_key(stored.subject_wallet, stored.id),
                          bytes_t{});
  batch.puts.emplace_back(key::make_tag_key(stored.tag, stored.id), bytes_t{});
  batch.puts.emplace_back(key::make_next_id_key(),
                          encoder.encode(attestation_id_t{stored.id + 1}));

  if (auto failed = storage_.commit(batch)) {
    return *failed;
  }
  spdlog::info("Stored {} attestation {} for {}", tag_name(stored.tag),
               stored.id, to_hex(stored.subject_wallet));
  return stored.id;
}

result_t<attestation_id_t> attestation_store::verify_and_store_attestation(
    const attestation_t& record,
    const zkaffinity::attestation::publisher_registry& registry) {
  auto verdict = registry.verify(record);
  if (!verdict.valid) {
    spdlog::warn("Rejected attestation from {}: {}", record.publisher,
                 zkaffinity::attestation::to_string(verdict.reason));
    return make_error(error_code::validation_error,
                      "Invalid attestation signature: " +
                          std::string{zkaffinity::attestation::to_string(
                              verdict.reason)});
  }
  return store_attestation(record);
}

result_t<std::vector<attestation_t>> attestation_store::get_attestations(
    const std::string_view subject_wallet,
    const std::optional<std::string_view> tag_filter) const {
  auto wallet = try_make_address(subject_wallet);
  if (!wallet) {
    return make_error(error_code::validation_error,
                      "Invalid wallet address format");
  }
  if (!tag_filter) {
    return get_attestations(*wallet);
  }
  auto tag = parse_tag_filter(*tag_filter);
  if (has_error(tag)) {
    return get_error(tag);
  }
  return get_attestations(*wallet, get_value(tag));
}

result_t<std::vector<attestation_t>> attestation_store::get_attestations(
    const address_t& subject_wallet,
    const std::optional<tag_t> tag_filter) const {
  auto view = storage_.snapshot();
  return load_indexed(view, key::make_wallet_prefix(subject_wallet), "Wallet",
                      tag_filter);
}

result_t<std::vector<attestation_t>> attestation_store::get_attestations_by_tag(
    const std::string_view tag) const {
  auto parsed = parse_tag_filter(tag);
  if (has_error(parsed)) {
    return get_error(parsed);
  }
  return get_attestations_by_tag(get_value(parsed));
}

result_t<std::vector<attestation_t>> attestation_store::get_attestations_by_tag(
    const tag_t tag) const {
  auto view = storage_.snapshot();
  return load_indexed(view, key::make_tag_prefix(tag), "Tag", std::nullopt);
}

result_t<std::optional<attestation_t>> attestation_store::get_attestation(
    const attestation_id_t id) const {
  auto raw = storage_.get(key::make_attestation_key(id));
  if (has_error(raw)) {
    return get_error(raw);
  }
  if (!get_value(raw)) {
    return std::optional<attestation_t>{};
  }
  auto record = decode_record(*get_value(raw));
  if (has_error(record)) {
    return get_error(record);
  }
  return std::optional<attestation_t>{std::move(get_value(record))};
}

void attestation_store::mark_consumed(
    const std::span<const attestation_id_t> ids) {
  if (ids.empty()) {
    return;
  }
  auto lock = std::scoped_lock{write_mutex_};
  auto batch = zkaffinity::storage::write_batch{};
  for (const auto id : ids) {
    auto record = get_attestation(id);
    if (has_error(record)) {
      spdlog::warn("Failed to load attestation {} for consumption: {}", id,
                   get_error(record).message);
      continue;
    }
    if (!get_value(record)) {
      spdlog::warn("Attestation {} no longer exists", id);
      continue;
    }
    auto updated = *get_value(record);
    updated.consumed = true;
    batch.puts.emplace_back(key::make_attestation_key(id),
                            encode_record(updated));
  }
  if (batch.puts.empty()) {
    return;
  }
  if (auto failed = storage_.commit(batch)) {
    spdlog::warn("Failed to mark attestations consumed: {}", failed->message);
    return;
  }
  spdlog::debug("Marked {} attestations consumed", batch.puts.size());
}

result_t<attestation_stats_t> attestation_store::stats() const {
  auto view = storage_.snapshot();
  auto rows = view.list_by_prefix(key::make_attestation_prefix());
  if (has_error(rows)) {
    return get_error(rows);
  }

  auto out = attestation_stats_t{};
  auto wallets = std::set<address_t>{};
  auto publishers = std::set<std::string>{};
  for (const auto& [unused, value] : get_value(rows)) {
    auto record = decode_record(value);
    if (has_error(record)) {
      return get_error(record);
    }
    const auto& o = get_value(record);
    ++out.total;
    if (o.consumed) {
      ++out.consumed;
    }
    ++out.by_tag[std::string{tag_name(o.tag)}];
    wallets.insert(o.subject_wallet);
    publishers.insert(o.publisher);
    out.oldest = std::min(out.oldest.value_or(o.timestamp), o.timestamp);
    out.newest = std::max(out.newest.value_or(o.timestamp), o.timestamp);
  }
  out.unique_wallets = wallets.size();
  out.unique_publishers = publishers.size();
  return out;
}

result_t<uint64_t> attestation_store::cleanup_older_than(
    const timestamp_seconds_t cutoff) {
  auto lock = std::scoped_lock{write_mutex_};
  auto rows = storage_.list_by_prefix(key::make_attestation_prefix());
  if (has_error(rows)) {
    return get_error(rows);
  }

  auto batch = zkaffinity::storage::write_batch{};
  auto removed = uint64_t{0};
  for (const auto& [record_key, value] : get_value(rows)) {
    auto record = decode_record(value);
    if (has_error(record)) {
      return get_error(record);
    }
    const auto& o = get_value(record);
    if (o.timestamp >= cutoff) {
      continue;
    }
    // The nonce entry stays behind so an expired attestation cannot be
    // replayed into the store.
    batch.deletes.push_back(record_key);
    batch.deletes.push_back(key::make_wallet_key(o.subject_wallet, o.id));
    batch.deletes.push_back(key::make_tag_key(o.tag, o.id));
    ++removed;
  }
  if (removed == 0) {
    return removed;
  }
  if (auto failed = storage_.commit(batch)) {
    return *failed;
  }
  spdlog::info("Removed {} attestations older than {}", removed, cutoff);
  return removed;
}

}  // namespace zkaffinity::store
