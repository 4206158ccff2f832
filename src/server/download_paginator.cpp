#include "server/download_paginator.hpp"
#include "codec/payload_codec.hpp"
#include "network/tunnel_error.hpp"
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace server {

DownloadPaginator::DownloadPaginator(store::KeyValueStore& committed, store::KeyValueStore& outbound,
                                     std::chrono::milliseconds pass_timeout)
  : committed_(committed)
  , outbound_(outbound)
  , pass_timeout_(pass_timeout) {
  BOOST_LOG_TRIVIAL(debug) << "Download paginator: Initialized with slice size " << SLICE_SIZE;
}

std::optional<std::string> DownloadPaginator::read(const std::string& name, uint16_t query_id) {
  const std::string key = store::fold_key(name);
  if (key.empty()) {
    throw network::MalformedNameError("read query without key");
  }

  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  expire_passes(now);

  auto current = committed_.get(key);
  auto it = passes_.find(key);
  if (it != passes_.end() && (!current || *current != it->second.source)) {
    BOOST_LOG_TRIVIAL(debug) << "Download paginator: Value of key " << key << " changed, dropping its pass";
    end_pass(key);
    it = passes_.end();
  }

  if (it != passes_.end()) {
    Pass& pass = it->second;
    if (pass.last_id == query_id) {
      BOOST_LOG_TRIVIAL(debug) << "Download paginator: Re-serving slice for retransmitted read " << query_id
                               << " of key " << key;
      pass.last_activity = now;
      return pass.last_slice;
    }
    if (pass.finished || static_cast<uint16_t>(pass.last_id + 1) != query_id) {
      BOOST_LOG_TRIVIAL(debug) << "Download paginator: Read " << query_id << " does not continue pass of key "
                               << key << ", starting over";
      end_pass(key);
      it = passes_.end();
    }
  }

  if (it == passes_.end()) {
    if (!current) {
      BOOST_LOG_TRIVIAL(info) << "Download paginator: No value stored under key " << key;
      return std::nullopt;
    }
    Pass pass;
    pass.source = *current;
    begin_pass(key, pass);
    it = passes_.emplace(key, std::move(pass)).first;
  }

  Pass& pass = it->second;
  auto remainder = outbound_.get(key);
  if (!remainder) {
    // Outbound entry removed by someone else; never serve a slice of another pass
    BOOST_LOG_TRIVIAL(warning) << "Download paginator: Outbound entry of key " << key << " vanished";
    end_pass(key);
    throw network::DecodeError("pass for key " + key + " lost its remainder");
  }

  std::string slice = remainder->substr(0, SLICE_SIZE);
  if (slice.size() < SLICE_SIZE) {
    // Short slice ends the pass; the record stays for retransmissions until it expires
    outbound_.remove(key);
    pass.finished = true;
    BOOST_LOG_TRIVIAL(info) << "Download paginator: Served final slice of " << slice.size()
                            << " bytes for key " << key;
  } else {
    // A full slice keeps the entry, even empty, so the pass ends with a short read
    outbound_.set(key, remainder->substr(SLICE_SIZE));
    BOOST_LOG_TRIVIAL(debug) << "Download paginator: Served slice for key " << key << ", "
                             << remainder->size() - SLICE_SIZE << " bytes remaining";
  }

  pass.last_id = query_id;
  pass.last_slice = slice;
  pass.last_activity = now;
  return slice;
}

std::size_t DownloadPaginator::active_passes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return passes_.size();
}

void DownloadPaginator::begin_pass(const std::string& key, const Pass& pass) {
  std::string encoded = codec::PayloadCodec::encode(codec::Message{key, pass.source});
  outbound_.set(key, encoded);
  BOOST_LOG_TRIVIAL(debug) << "Download paginator: Staged " << encoded.size()
                           << " encoded bytes for key " << key;
}

void DownloadPaginator::expire_passes(std::chrono::steady_clock::time_point now) {
  for (auto it = passes_.begin(); it != passes_.end();) {
    if (now - it->second.last_activity > pass_timeout_) {
      BOOST_LOG_TRIVIAL(debug) << "Download paginator: Expiring idle pass of key " << it->first;
      if (!it->second.finished) {
        outbound_.remove(it->first);
      }
      it = passes_.erase(it);
    } else {
      ++it;
    }
  }
}

void DownloadPaginator::end_pass(const std::string& key) {
  outbound_.remove(key);
  passes_.erase(key);
}

} // namespace server
} // namespace dnskv
