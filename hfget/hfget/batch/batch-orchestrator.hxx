#pragma once

#include <filesystem>

#include <boost/asio.hpp>

#include <hfget/hub/hub-types.hxx>
#include <hfget/batch/batch-types.hxx>
#include <hfget/transfer/transfer-engine.hxx>

namespace hfget
{
  namespace fs = std::filesystem;

  // Sequential multi-file transfer.
  //
  // Files are processed one at a time in the given order. Each is first
  // compared against what is on disk: complete files are skipped without
  // touching the network, partial ones are resumed, absent ones are fetched
  // from scratch. A failed file does not stop the batch; cancellation does,
  // and is checked before every file as well as inside each transfer.
  //
  class batch_orchestrator
  {
  public:
    explicit
    batch_orchestrator (transfer_engine& e)
      : engine_ (e) {}

    asio::awaitable<batch_summary>
    run (const file_entries&,
         const fs::path& dir,
         transfer_control_ptr = nullptr,
         transfer_event_handler = nullptr);

  private:
    transfer_engine& engine_;
  };
}
