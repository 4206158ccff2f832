#pragma once

#include <string>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <stdexcept>

namespace dnskv {
namespace store {

// Text store shared by the server-side protocol components. Keys are
// case-folded to uppercase by every operation, since DNS names are
// case-insensitive on the wire.
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Returns the value stored under key, if any
  virtual std::optional<std::string> get(const std::string& key) const = 0;
  // Stores value under key, replacing any previous value
  virtual void set(const std::string& key, const std::string& value) = 0;
  // Appends text to the value under key, creating an empty entry first
  virtual void append(const std::string& key, const std::string& text) = 0;
  // Reads and removes the value under key in one step
  virtual std::optional<std::string> take(const std::string& key) = 0;
  // Removes the entry; returns false if it did not exist
  virtual bool remove(const std::string& key) = 0;
  // Removes every entry
  virtual void clear() = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool has(const std::string& key) const = 0;
  virtual std::size_t size() const = 0;
};

class MemoryStore : public KeyValueStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemoryStore(const std::string& name);


  // ---- CORE STORAGE OPERATIONS ----
  std::optional<std::string> get(const std::string& key) const override;
  void set(const std::string& key, const std::string& value) override;
  void append(const std::string& key, const std::string& text) override;
  std::optional<std::string> take(const std::string& key) override;
  bool remove(const std::string& key) override;
  void clear() override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const override;
  std::size_t size() const override;

private:
  // ---- PARAMETERS ----
  // Used to tell stores apart in the log
  const std::string name_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> entries_;
};

// Uppercases ASCII letters; other bytes are left untouched
std::string fold_key(const std::string& key);

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace dnskv
