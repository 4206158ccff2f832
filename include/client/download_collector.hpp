#ifndef DNSKV_CLIENT_DOWNLOAD_COLLECTOR_HPP
#define DNSKV_CLIENT_DOWNLOAD_COLLECTOR_HPP

#include <string>
#include "client/query_session.hpp"
#include "codec/message.hpp"

namespace dnskv {
namespace client {

class DownloadCollector {
public:
  // A slice shorter than this ends the download
  static constexpr std::size_t FULL_SLICE = network::MAX_CHARACTER_STRING;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DownloadCollector(QuerySession& session);


  // ---- DOWNLOAD OPERATIONS ----
  // Reads slices of key until a short one arrives and decodes the result.
  // Throws KeyNotFoundError for an unknown key, FormatError for a reply
  // without TXT answer or undecodable text.
  codec::Message download(const std::string& key);

private:
  // ---- PARAMETERS ----
  QuerySession& session_;


  // ---- SLICE HANDLING ----
  std::string read_slice(const std::string& key);
};

} // namespace client
} // namespace dnskv

#endif // DNSKV_CLIENT_DOWNLOAD_COLLECTOR_HPP
