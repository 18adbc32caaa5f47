#pragma once

#include <cstddef>

// ── Copy tool exit codes ────────────────────────────────────
constexpr int RSYNC_EXIT_OK              = 0;
constexpr int RSYNC_EXIT_VANISHED        = 24;    // some source files vanished during the scan
constexpr int ROBOCOPY_FATAL_THRESHOLD   = 8;     // 0-7 are success variants, >= 8 is failure

// ── Process supervision ─────────────────────────────────────
constexpr int PROCESS_EXIT_CANCELLED     = -2;    // wait() result after cancel()
constexpr int PROCESS_EXIT_SIGNALED      = -1;    // killed by a signal we did not send
constexpr int PROCESS_POLL_MS            = 100;   // output read / exit poll interval
constexpr int PROCESS_TERM_GRACE_MS      = 2000;  // SIGTERM -> SIGKILL escalation
constexpr int PROCESS_READ_BUF_SIZE      = 4096;

// ── Retry policy ────────────────────────────────────────────
constexpr int RETRY_BACKOFF_MS           = 1000;  // fixed delay before re-running on a transient exit
constexpr int DEFAULT_RETRY_COUNT        = 3;

// ── Network probing ─────────────────────────────────────────
constexpr int VPN_ESTABLISH_WAIT_SECS    = 10;    // poll check_vpn() after openconnect returns
constexpr int VPN_ESTABLISH_POLL_MS      = 500;
constexpr int MONITOR_INTERVAL_SECS      = 30;    // background connection monitor period

// ── Defaults written to a fresh global config ───────────────
constexpr const char* DEFAULT_VPN_HOST      = "vpn.fhnw.ch";
constexpr const char* DEFAULT_VPN_PROTOCOL  = "anyconnect";
constexpr const char* DEFAULT_SHARE_HOST    = "fs.edu.ds.fhnw.ch";
constexpr const char* DEFAULT_SHARE_PATH    = "data";
constexpr const char* DEFAULT_CHECK_HOST    = "fs.edu.ds.fhnw.ch";
#ifdef __APPLE__
constexpr const char* DEFAULT_MOUNT_POINT   = "/Volumes/data";
#elif defined(_WIN32)
constexpr const char* DEFAULT_MOUNT_POINT   = "";
#else
constexpr const char* DEFAULT_MOUNT_POINT   = "/mnt/data";
#endif

// ── Run history ─────────────────────────────────────────────
constexpr std::size_t HISTORY_MAX_RUNS   = 50;

// ── Files ───────────────────────────────────────────────────
constexpr const char* PROFILE_FILE_NAME  = "sharesync.yaml";
constexpr const char* LEGACY_CONFIG_FILE = "config.txt";
