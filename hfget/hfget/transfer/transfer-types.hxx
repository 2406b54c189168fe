#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <filesystem>

namespace hfget
{
  namespace fs = std::filesystem;

  // Transfer state.
  //
  enum class transfer_state
  {
    idle,         // Not started yet
    probing,      // Querying the remote size
    transferring, // Streaming the body
    paused,       // Paused by the controller
    completed,    // Done or already present
    cancelled,    // Stopped by the controller
    failed        // Failed with error
  };

  inline std::ostream&
  operator<< (std::ostream& os, transfer_state s)
  {
    switch (s)
    {
    case transfer_state::idle:         return os << "idle";
    case transfer_state::probing:      return os << "probing";
    case transfer_state::transferring: return os << "transferring";
    case transfer_state::paused:       return os << "paused";
    case transfer_state::completed:    return os << "completed";
    case transfer_state::cancelled:    return os << "cancelled";
    case transfer_state::failed:       return os << "failed";
    }
    return os;
  }

  inline bool
  terminal (transfer_state s) noexcept
  {
    return s == transfer_state::completed ||
           s == transfer_state::cancelled ||
           s == transfer_state::failed;
  }

  // Tunables of the transfer engine.
  //
  struct transfer_traits
  {
    // Size of the body piece read and written at once.
    //
    std::size_t chunk_size = 8192;

    // Total number of GET attempts for transient network failures.
    //
    std::uint32_t max_attempts = 3;

    // Delay between attempts in milliseconds.
    //
    std::uint32_t retry_delay = 2000;

    // Size probe timeout in milliseconds.
    //
    std::uint32_t probe_timeout = 10000;

    // Maximum time without progress while streaming, in milliseconds.
    //
    std::uint32_t transfer_timeout = 60000;

    // Upper bound on a single pause wait in milliseconds. A pause is also
    // woken up early by resume() and cancel().
    //
    std::uint32_t pause_interval = 250;
  };

  // A single file to fetch.
  //
  struct transfer_request
  {
    std::string url;
    fs::path    target;

    transfer_request () = default;

    transfer_request (std::string u, fs::path t)
      : url (std::move (u)), target (std::move (t)) {}
  };

  // Event reported by a running transfer.
  //
  // Progress events carry the byte counters, status events carry a human
  // readable message and the state the transfer is in after it. The finished
  // event is sent once by whoever drives the transfer or batch, after
  // everything else, with the overall outcome.
  //
  struct transfer_event
  {
    enum class kind_type
    {
      progress,
      status,
      finished
    };

    kind_type      kind {kind_type::status};
    transfer_state state {transfer_state::idle};
    std::string    message;
    double         percent {0.0};
    std::uint64_t  downloaded {0};
    std::uint64_t  total {0}; // 0 if unknown
    std::string    target;

    static transfer_event
    progress (std::uint64_t downloaded,
              std::uint64_t total,
              std::string target = std::string ());

    static transfer_event
    status (transfer_state,
            std::string message,
            std::string target = std::string ());

    static transfer_event
    finished (transfer_state, std::string message = std::string ());

    bool
    is_progress () const noexcept
    {
      return kind == kind_type::progress;
    }
  };

  // Outcome of a transfer.
  //
  struct transfer_result
  {
    transfer_state state {transfer_state::idle};
    std::uint64_t  bytes {0}; // On disk when finished.
    std::uint64_t  total {0}; // 0 if unknown.
    std::string    message;

    transfer_result () = default;

    transfer_result (transfer_state s,
                     std::uint64_t b,
                     std::uint64_t t,
                     std::string m)
      : state (s), bytes (b), total (t), message (std::move (m)) {}

    bool
    success () const noexcept
    {
      return state == transfer_state::completed;
    }

    explicit
    operator bool () const noexcept
    {
      return success ();
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const transfer_result& r)
  {
    os << r.state;

    if (!r.message.empty ())
      os << ": " << r.message;

    return os;
  }

  // Return the percentage of total, 0 if the total is unknown.
  //
  inline double
  percent_of (std::uint64_t n, std::uint64_t total) noexcept
  {
    return total > 0 ? static_cast<double> (n) * 100.0 / total : 0.0;
  }

  // Format a byte count using binary units with two decimals, for example
  // "1.50 KB".
  //
  std::string
  format_size (std::uint64_t);
}
