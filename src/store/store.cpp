#include "store/store.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace store {

namespace {

std::string checked_key(const std::string& key) {
  if (key.empty()) {
    throw StoreError("Store: Empty key");
  }
  return fold_key(key);
}

} // namespace

std::string fold_key(const std::string& key) {
  std::string folded = key;
  std::transform(folded.begin(), folded.end(), folded.begin(), [](unsigned char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : static_cast<char>(c);
  });
  return folded;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemoryStore::MemoryStore(const std::string& name) : name_(name) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Initializing memory store " << name_;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::optional<std::string> MemoryStore::get(const std::string& key) const {
  std::string folded = checked_key(key);
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = entries_.find(folded);
  if (it == entries_.end()) {
    BOOST_LOG_TRIVIAL(trace) << "Store: " << name_ << " has no entry for key: " << folded;
    return std::nullopt;
  }
  return it->second;
}

void MemoryStore::set(const std::string& key, const std::string& value) {
  std::string folded = checked_key(key);
  std::lock_guard<std::mutex> lock(mutex_);

  entries_[folded] = value;
  BOOST_LOG_TRIVIAL(debug) << "Store: " << name_ << " stored " << value.size()
                           << " bytes with key: " << folded;
}

void MemoryStore::append(const std::string& key, const std::string& text) {
  std::string folded = checked_key(key);
  std::lock_guard<std::mutex> lock(mutex_);

  std::string& entry = entries_[folded];
  entry += text;
  BOOST_LOG_TRIVIAL(trace) << "Store: " << name_ << " appended " << text.size()
                           << " bytes to key: " << folded << " (now " << entry.size() << ")";
}

std::optional<std::string> MemoryStore::take(const std::string& key) {
  std::string folded = checked_key(key);
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = entries_.find(folded);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  std::string value = std::move(it->second);
  entries_.erase(it);
  BOOST_LOG_TRIVIAL(debug) << "Store: " << name_ << " took " << value.size()
                           << " bytes from key: " << folded;
  return value;
}

bool MemoryStore::remove(const std::string& key) {
  std::string folded = checked_key(key);
  std::lock_guard<std::mutex> lock(mutex_);

  bool removed = entries_.erase(folded) > 0;
  BOOST_LOG_TRIVIAL(debug) << "Store: " << name_ << (removed ? " removed" : " had nothing to remove for")
                           << " key: " << folded;
  return removed;
}

void MemoryStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  BOOST_LOG_TRIVIAL(info) << "Store: " << name_ << " cleared";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool MemoryStore::has(const std::string& key) const {
  std::string folded = checked_key(key);
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(folded) > 0;
}

std::size_t MemoryStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace store
} // namespace dnskv
