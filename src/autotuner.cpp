#include "autotuner.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <string>

namespace gemm {

static constexpr int MR = 4;   // must match kernel
static constexpr int NR = 16;  // must match kernel

static const char* env_value(const char* name) {
  const char* s = std::getenv(name);
  return (s && *s) ? s : nullptr;
}

static int env_tile(const char* name, int fallback) {
  const char* s = env_value(name);
  return s ? std::atoi(s) : fallback;
}

static int align_down(int x, int m) { return std::max(m, x - x % m); }
static int clamp_int(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }

// "48K", "1M", "32768" -> bytes. 0 when unparsable.
static size_t parse_bytes(const std::string& text) {
  const char* s = text.c_str();
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || v <= 0.0) return 0;
  double mult = 1.0;
  switch (*end) {
    case 'K': case 'k': mult = 1024.0; break;
    case 'M': case 'm': mult = 1024.0 * 1024.0; break;
    case 'G': case 'g': mult = 1024.0 * 1024.0 * 1024.0; break;
    default: break;
  }
  return (size_t)(v * mult + 0.5);
}

// First whitespace-delimited token of a sysfs attribute.
static std::string sysfs_token(const std::string& path) {
  std::ifstream ifs(path);
  std::string tok;
  ifs >> tok;
  return tok;
}

struct CacheSizes { size_t l1d = 0, l2 = 0; };

// Env overrides, then cpu0's sysfs cache descriptors, then fixed fallbacks.
static CacheSizes probe_caches() {
  CacheSizes c;
  if (const char* s = env_value("MV3_L1D")) c.l1d = parse_bytes(s);
  if (const char* s = env_value("MV3_L2")) c.l2 = parse_bytes(s);

  for (int idx = 0; idx < 10 && (c.l1d == 0 || c.l2 == 0); ++idx) {
    const std::string dir = "/sys/devices/system/cpu/cpu0/cache/index" + std::to_string(idx) + "/";
    const std::string level = sysfs_token(dir + "level");
    const std::string type = sysfs_token(dir + "type");
    const size_t bytes = parse_bytes(sysfs_token(dir + "size"));
    if (level.empty() || bytes == 0) continue;
    if (level == "1" && type == "Data" && c.l1d == 0) c.l1d = bytes;
    else if (level == "2" && type != "Instruction" && c.l2 == 0) c.l2 = bytes;
  }
  if (c.l1d == 0) c.l1d = 32 * 1024;
  if (c.l2 == 0) c.l2 = 1024 * 1024;
  return c;
}

static const CacheSizes& cache_sizes() {
  static const CacheSizes c = probe_caches();
  return c;
}

TileParams pick_tiles(int M, int N, int K, int dtype_bytes){
  if (env_value("MV3_GEMM_MC") || env_value("MV3_GEMM_KC") || env_value("MV3_GEMM_NC")) {
    TileParams t{env_tile("MV3_GEMM_MC", 64), env_tile("MV3_GEMM_KC", 256), env_tile("MV3_GEMM_NC", N)};
    t.MC = clamp_int(align_down(std::max(MR, t.MC), MR), MR, std::max(MR, M));
    t.KC = clamp_int(t.KC, 1, std::max(1, K));
    t.NC = clamp_int(align_down(std::max(NR, t.NC), NR), NR, std::max(NR, N));
    return t;
  }

  const CacheSizes& c = cache_sizes();
  const size_t elem = (size_t)dtype_bytes;

  // one MR x KC slice of A and one KC x NR slice of B share half of L1
  int KC = clamp_int((int)((c.l1d / 2) / ((size_t)(MR + NR) * elem)), 16, 1024);
  KC = std::min(KC, std::max(1, K));

  // the packed MC x KC block of A takes half of L2
  int MC = (int)((c.l2 / 2) / ((size_t)KC * elem));
  MC = clamp_int(align_down(std::max(MR, MC), MR), MR, 512);
  MC = std::min(MC, std::max(MR, ((M + MR - 1) / MR) * MR));

  // B panel (KC x NC) shared across threads; take all of N up to a cap
  int NC = std::max(NR, ((N + NR - 1) / NR) * NR);
  NC = std::min(NC, 4096);

  return TileParams{MC, KC, NC};
}

} // namespace gemm
