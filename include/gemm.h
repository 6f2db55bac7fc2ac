#pragma once
#include <cstddef>

namespace gemm {

// Row-major, float32. op(A): [M x K], op(B): [K x N], C: [M x N]
// Computes: C = alpha * op(A) @ op(B) + beta * C
// op(X) is X or X^T; lda/ldb/ldc are row strides of the stored matrices.
// Each C element is reduced by a single thread in a fixed K order, so the
// result does not depend on the OpenMP thread count.
void sgemm(bool transA, bool transB,
           int M, int N, int K,
           float alpha,
           const float* A, int lda,
           const float* B, int ldb,
           float beta,
           float* C, int ldc);

// Contiguous, untransposed shorthand: A [M x K], B [K x N], C [M x N].
void sgemm_blocked(const float* A, int M, int K,
                   const float* B, int N,
                   float* C,
                   float alpha = 1.0f, float beta = 0.0f);

} // namespace gemm
