// Repository: Rollups-advance-runner
// Component: Runner Configuration
// Copyright (c) 2025 Rollups

#include "rollups/runner/RunnerConfig.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <utility>
#include <vector>

namespace rollups::runner {

namespace {

constexpr size_t kDAppAddressSize = 20;

template <typename T>
bool ParseNumber(const std::string& text, T* out) {
  if (text.empty()) return false;
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) return false;
  *out = value;
  return true;
}

bool ParseBool(const std::string& text, bool* out) {
  if (text == "true" || text == "1") { *out = true; return true; }
  if (text == "false" || text == "0") { *out = false; return true; }
  return false;
}

// Applies one setting by its flag name (without the leading dashes). Both the
// environment and the command line go through here.
bool Apply(RunnerConfig* c, const std::string& key, const std::string& value,
           std::string* error) {
  bool ok = true;
  if (key == "server-manager-endpoint") {
    c->server_manager_endpoint = value;
  } else if (key == "session-id") {
    c->session_id = value;
  } else if (key == "server-manager-deadline-ms") {
    ok = ParseNumber(value, &c->server_manager_deadline_ms) && c->server_manager_deadline_ms > 0;
  } else if (key == "pending-inputs-sleep-ms") {
    ok = ParseNumber(value, &c->pending_inputs_sleep_ms) && c->pending_inputs_sleep_ms >= 0;
  } else if (key == "pending-inputs-max-retries") {
    ok = ParseNumber(value, &c->pending_inputs_max_retries) && c->pending_inputs_max_retries >= 0;
  } else if (key == "broker-endpoint") {
    c->broker_endpoint = value;
  } else if (key == "broker-deadline-ms") {
    ok = ParseNumber(value, &c->broker_deadline_ms) && c->broker_deadline_ms > 0;
  } else if (key == "broker-consume-timeout-ms") {
    ok = ParseNumber(value, &c->broker_consume_timeout_ms) && c->broker_consume_timeout_ms > 0;
  } else if (key == "chain-id") {
    ok = ParseNumber(value, &c->dapp.chain_id);
  } else if (key == "dapp-address") {
    std::vector<uint8_t> address;
    ok = FromHex(value, &address) && address.size() == kDAppAddressSize;
    if (ok) c->dapp.dapp_address = std::move(address);
  } else if (key == "snapshot-dir") {
    c->snapshot_dir = value;
  } else if (key == "snapshot-latest") {
    c->snapshot_latest = value;
  } else if (key == "snapshot-enabled") {
    ok = ParseBool(value, &c->snapshot_enabled);
  } else if (key == "machine-dir") {
    c->machine_dir = value;
  } else if (key == "metrics-port") {
    ok = ParseNumber(value, &c->metrics_port) && c->metrics_port >= 0 &&
         c->metrics_port <= std::numeric_limits<uint16_t>::max();
  } else {
    *error = "Unknown argument: --" + key;
    return false;
  }

  if (!ok) *error = "Invalid value for " + key + ": '" + value + "'";
  return ok;
}

struct EnvBinding {
  const char* env;
  const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"SERVER_MANAGER_ENDPOINT", "server-manager-endpoint"},
    {"SESSION_ID", "session-id"},
    {"SERVER_MANAGER_DEADLINE_MS", "server-manager-deadline-ms"},
    {"PENDING_INPUTS_SLEEP_MS", "pending-inputs-sleep-ms"},
    {"PENDING_INPUTS_MAX_RETRIES", "pending-inputs-max-retries"},
    {"BROKER_ENDPOINT", "broker-endpoint"},
    {"BROKER_DEADLINE_MS", "broker-deadline-ms"},
    {"BROKER_CONSUME_TIMEOUT_MS", "broker-consume-timeout-ms"},
    {"CHAIN_ID", "chain-id"},
    {"DAPP_ADDRESS", "dapp-address"},
    {"SNAPSHOT_DIR", "snapshot-dir"},
    {"SNAPSHOT_LATEST", "snapshot-latest"},
    {"SNAPSHOT_ENABLED", "snapshot-enabled"},
    {"MACHINE_DIR", "machine-dir"},
    {"METRICS_PORT", "metrics-port"},
};

}  // namespace

EnvLookup ProcessEnv() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
  };
}

ConfigResult ParseArgs(int argc, const char* const argv[], const EnvLookup& env) {
  ConfigResult result;
  RunnerConfig& c = result.config;

  for (const EnvBinding& binding : kEnvBindings) {
    std::optional<std::string> value = env(binding.env);
    if (!value) continue;
    std::string error;
    if (!Apply(&c, binding.key, *value, &error)) {
      result.error = std::string(binding.env) + ": " + error;
      return result;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      result.help = true;
      result.valid = true;
      return result;
    } else if (arg == "--no-snapshots") {
      c.snapshot_enabled = false;
    } else if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
      if (!Apply(&c, arg.substr(2), argv[++i], &result.error)) return result;
    } else if (arg.rfind("--", 0) == 0) {
      result.error = "Missing value for " + arg;
      return result;
    } else {
      result.error = "Unknown argument: " + arg;
      return result;
    }
  }

  // Validate
  if (c.dapp.dapp_address.empty()) {
    result.error = "--dapp-address (DAPP_ADDRESS) is required";
    return result;
  }
  if (c.snapshot_enabled && c.snapshot_dir.empty()) {
    result.error = "--snapshot-dir (SNAPSHOT_DIR) is required unless --no-snapshots is set";
    return result;
  }
  if (!c.snapshot_enabled && c.machine_dir.empty()) {
    result.error = "--machine-dir (MACHINE_DIR) is required with --no-snapshots";
    return result;
  }

  result.valid = true;
  return result;
}

void PrintUsage(std::ostream& out, const char* program_name) {
  out << "Usage: " << program_name << " [OPTIONS]\n"
      << "\n"
      << "Feeds rollup inputs from the broker to the server-manager session,\n"
      << "finishing epochs, storing snapshots and producing claims.\n"
      << "Every option can also be set through the environment variable shown.\n"
      << "\n"
      << "SERVER MANAGER:\n"
      << "  --server-manager-endpoint ADDR    SERVER_MANAGER_ENDPOINT (default: 127.0.0.1:5001)\n"
      << "  --session-id ID                   SESSION_ID (default: default_rollups_id)\n"
      << "  --server-manager-deadline-ms MS   SERVER_MANAGER_DEADLINE_MS (default: 300000)\n"
      << "  --pending-inputs-sleep-ms MS      PENDING_INPUTS_SLEEP_MS (default: 1000)\n"
      << "  --pending-inputs-max-retries N    PENDING_INPUTS_MAX_RETRIES (default: 600)\n"
      << "\n"
      << "BROKER:\n"
      << "  --broker-endpoint ADDR            BROKER_ENDPOINT (default: 127.0.0.1:6390)\n"
      << "  --broker-deadline-ms MS           BROKER_DEADLINE_MS (default: 30000)\n"
      << "  --broker-consume-timeout-ms MS    BROKER_CONSUME_TIMEOUT_MS (default: 5000)\n"
      << "  --chain-id N                      CHAIN_ID (default: 0)\n"
      << "  --dapp-address HEX                DAPP_ADDRESS (required, 20 bytes)\n"
      << "\n"
      << "SNAPSHOTS:\n"
      << "  --snapshot-dir PATH               SNAPSHOT_DIR (required unless --no-snapshots)\n"
      << "  --snapshot-latest PATH            SNAPSHOT_LATEST (default: <snapshot-dir>/latest)\n"
      << "  --no-snapshots                    SNAPSHOT_ENABLED=false\n"
      << "  --machine-dir PATH                MACHINE_DIR (required with --no-snapshots)\n"
      << "\n"
      << "TELEMETRY:\n"
      << "  --metrics-port PORT               METRICS_PORT (default: 8080, 0 disables)\n"
      << "  --help                            Show this help message\n"
      << "\n"
      << "Set ROLLUPS_DEBUG=1 for debug logging.\n";
}

}  // namespace rollups::runner
