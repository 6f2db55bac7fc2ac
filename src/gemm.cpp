// gemm.cpp: portable SGEMM with classic 3-level blocking (MC, KC, NC)
// Transposes are folded into packing, alpha into the A pack, beta applied up front.
#include "gemm.h"
#include "autotuner.h"
#include "aligned_alloc.hpp"
#include "mv3_compiler.hpp"

#include <algorithm>
#include <cstring>

namespace gemm {

static constexpr int MR = 4;    // micro rows
static constexpr int NR = 16;   // micro cols

// ---------------- packing ----------------
// A: pack MR rows of op(A) across Kc (k-major), fuse alpha
static inline void pack_A_tile(const float* A, int lda, bool transA,
                               int r0, int mr_eff, int k0, int Kc, float alpha,
                               float* MV3_RESTRICT Ap){
  for(int k=0;k<Kc;++k){
    const int kk = k0 + k;
    float* dst = Ap + (size_t)k*MR;
    int r=0;
    if(!transA){ for(; r<mr_eff; ++r) dst[r] = A[(size_t)(r0+r)*lda + kk]*alpha; }
    else       { for(; r<mr_eff; ++r) dst[r] = A[(size_t)kk*lda + (r0+r)]*alpha; }
    for(; r<MR; ++r) dst[r] = 0.0f;
  }
}

// B: pack NR cols of op(B) across Kc (k-major)
static inline void pack_B_tile(const float* B, int ldb, bool transB,
                               int k0, int Kc, int j0, int nr_eff,
                               float* MV3_RESTRICT Bp){
  for(int k=0;k<Kc;++k){
    const int kk = k0 + k;
    float* dst = Bp + (size_t)k*NR;
    int j=0;
    if(!transB){
      const float* row = B + (size_t)kk*ldb + j0;
      for(; j<nr_eff; ++j) dst[j] = row[j];
    }else{
      for(; j<nr_eff; ++j) dst[j] = B[(size_t)(j0+j)*ldb + kk];
    }
    for(; j<NR; ++j) dst[j] = 0.0f;
  }
}

// ---------------- micro-kernel ----------------
// C[mr_eff x nr_eff] += Ap[MR x Kc] * Bp[Kc x NR]
static inline void micro_4x16_accum(const float* MV3_RESTRICT Ap,
                                    const float* MV3_RESTRICT Bp,
                                    float* MV3_RESTRICT C, int ldc, int Kc,
                                    int mr_eff, int nr_eff){
  float acc[MR][NR];
  for(int r=0;r<MR;++r) for(int j=0;j<NR;++j) acc[r][j]=0.0f;
  for(int k=0;k<Kc;++k){
    const float* a = Ap + (size_t)k*MR;
    const float* b = Bp + (size_t)k*NR;
    for(int r=0;r<MR;++r){
      const float ar = a[r];
      MV3_SIMD
      for(int j=0;j<NR;++j) acc[r][j] += ar*b[j];
    }
  }
  for(int r=0;r<mr_eff;++r){
    float* c = C + (size_t)r*ldc;
    for(int j=0;j<nr_eff;++j) c[j] += acc[r][j];
  }
}

// ---------------- top-level SGEMM ----------------
void sgemm(bool transA, bool transB,
           int M, int N, int K,
           float alpha,
           const float* A, int lda,
           const float* B, int ldb,
           float beta,
           float* C, int ldc)
{
  if(M<=0 || N<=0) return;

  const long long work = (long long)M * (long long)N * (long long)std::max(K, 1);
  const bool par = work >= MV3_PARALLEL_MIN_WORK;

  // C = beta*C; the blocked loop below only accumulates
  if(beta!=1.0f){
#pragma omp parallel for schedule(static) if(par)
    for(int i=0;i<M;++i){
      float* Crow = C + (size_t)i*ldc;
      if(beta==0.0f) std::memset(Crow, 0, sizeof(float)*N);
      else for(int j=0;j<N;++j) Crow[j]*=beta;
    }
  }
  if(alpha==0.0f || K<=0) return;

  const auto tiles = pick_tiles(M, N, K, /*dtype_bytes=*/4);
  const int MC = std::max(MR, tiles.MC);
  const int KC = std::max(1,  tiles.KC);
  const int NC = std::max(NR, tiles.NC);

  const int NC_round_cols = ((NC + NR - 1)/NR)*NR;
  const int MC_round_rows = ((MC + MR - 1)/MR)*MR;

  // Shared B panel; packed cooperatively once per (jc,k0)
  mv3::AlignedBuffer Bp_buf((size_t)KC * (size_t)NC_round_cols);
  float* Bp = Bp_buf.data();

#pragma omp parallel if(par)
  {
    mv3::AlignedBuffer Ap_thr((size_t)MC_round_rows * (size_t)KC);

    for(int jc=0; jc<N; jc+=NC){
      const int nc = std::min(NC, N - jc);
      const int NT = (nc + NR - 1)/NR;

      for(int k0=0; k0<K; k0+=KC){
        const int Kc = std::min(KC, K - k0);

#pragma omp for schedule(static)
        for(int tn=0; tn<NT; ++tn){
          const int j0     = jc + tn*NR;
          const int nr_eff = std::min(NR, N - j0);
          pack_B_tile(B, ldb, transB, k0, Kc, j0, nr_eff, Bp + (size_t)tn*Kc*NR);
        }

        // One thread owns each IC block, so every C element is summed in K order
#pragma omp for schedule(static)
        for(int ic=0; ic<M; ic+=MC){
          const int mc = std::min(MC, M - ic);
          const int MT = (mc + MR - 1)/MR;

          for(int tm=0; tm<MT; ++tm){
            const int r0     = ic + tm*MR;
            const int mr_eff = std::min(MR, M - r0);
            pack_A_tile(A, lda, transA, r0, mr_eff, k0, Kc, alpha,
                        Ap_thr.data() + (size_t)tm*Kc*MR);
          }

          for(int tm=0; tm<MT; ++tm){
            const int r0      = ic + tm*MR;
            const int mr_eff  = std::min(MR, M - r0);
            const float* Ap_t = Ap_thr.data() + (size_t)tm*Kc*MR;

            for(int tn=0; tn<NT; ++tn){
              const int j0     = jc + tn*NR;
              const int nr_eff = std::min(NR, N - j0);
              micro_4x16_accum(Ap_t, Bp + (size_t)tn*Kc*NR,
                               C + (size_t)r0*ldc + j0, ldc, Kc, mr_eff, nr_eff);
            } // tn
          }   // tm
        }     // ic
      }       // k0
    }         // jc
  } // omp parallel
}

void sgemm_blocked(const float* A, int M, int K,
                   const float* B, int N,
                   float* C,
                   float alpha, float beta)
{
  sgemm(false, false, M, N, K, alpha, A, K, B, N, beta, C, N);
}

} // namespace gemm
