#pragma once
#include <cstddef>

namespace gemm {

struct TileParams {
  int MC;
  int KC;
  int NC;
};

/// Pick (MC,KC,NC) for the portable MR x NR microkernel.
/// - MV3_GEMM_MC / MV3_GEMM_KC / MV3_GEMM_NC force tiles if set.
/// - Otherwise sizes come from the cache hierarchy: KC so that one A micro-panel
///   plus one B micro-panel stay in L1, MC so that the packed A block fits in
///   half of L2, NC the whole problem width.
/// - MV3_L1D, MV3_L2 override detected cache sizes (bytes, or with K/M/G suffix).
/// - dtype_bytes should be 4 for float.
TileParams pick_tiles(int M, int N, int K, int dtype_bytes = 4);

} // namespace gemm
