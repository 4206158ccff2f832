#ifndef DNSKV_SERVER_DOWNLOAD_PAGINATOR_HPP
#define DNSKV_SERVER_DOWNLOAD_PAGINATOR_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "store/store.hpp"

namespace dnskv {
namespace server {

class DownloadPaginator {
public:
  // Longest DNS character-string
  static constexpr std::size_t SLICE_SIZE = 255;
  // Idle time after which a pass is forgotten, finished or not
  static constexpr std::chrono::milliseconds PASS_TIMEOUT{10000};

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DownloadPaginator(store::KeyValueStore& committed, store::KeyValueStore& outbound,
                    std::chrono::milliseconds pass_timeout = PASS_TIMEOUT);


  // ---- DOWNLOAD PROCESSING ----
  // Returns the next slice of the encoded message stored under the key named
  // by the query, or nullopt if the key is unknown. A slice shorter than
  // SLICE_SIZE (possibly empty) ends the pass.
  //
  // A read continues the pass of its key only when its id follows the id of
  // the previous read and the committed value is unchanged; a repeated id
  // gets the previous slice again. Any other read starts a new pass.
  std::optional<std::string> read(const std::string& name, uint16_t query_id);

  // Number of passes currently tracked
  std::size_t active_passes() const;

private:
  struct Pass {
    uint16_t last_id = 0;
    std::string last_slice;
    // Committed value the pass is serving
    std::string source;
    bool finished = false;
    std::chrono::steady_clock::time_point last_activity;
  };

  // ---- PARAMETERS ----
  store::KeyValueStore& committed_;
  // Unsent remainder of the pass in progress per key
  store::KeyValueStore& outbound_;
  const std::chrono::milliseconds pass_timeout_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Pass> passes_;


  // ---- PASS HANDLING ----
  // Stages the encoded committed value as the outbound entry
  void begin_pass(const std::string& key, const Pass& pass);
  // Drops idle passes and their outbound remainders
  void expire_passes(std::chrono::steady_clock::time_point now);
  void end_pass(const std::string& key);
};

} // namespace server
} // namespace dnskv

#endif // DNSKV_SERVER_DOWNLOAD_PAGINATOR_HPP
