#include "internal/catalog/fingerprint.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "tests/support/embeddings.hpp"

namespace {

using artscan::catalog::FingerprintLockTable;
using artscan::catalog::Fingerprinter;

constexpr std::size_t kDim = 32;

void TestBucketsAreStableAcrossInstances() {
  Fingerprinter a(kDim);
  Fingerprinter b(kDim);

  const auto embedding = artscan::testing::AtDistance(kDim, 0.3, 5);
  assert(a.Bucket(embedding) == b.Bucket(embedding));
}

void TestIdenticalEmbeddingsShareBucket() {
  Fingerprinter fingerprinter(kDim);

  const auto embedding = artscan::testing::Axis(kDim, 7);
  const auto copy      = embedding;
  assert(fingerprinter.Bucket(embedding) == fingerprinter.Bucket(copy));
}

void TestBucketRespectsBitWidth() {
  Fingerprinter fingerprinter(kDim, 4);
  for (std::size_t axis = 0; axis < kDim; ++axis) {
    assert(fingerprinter.Bucket(artscan::testing::Axis(kDim, axis)) < 16);
  }
}

void TestDimensionMismatchThrows() {
  Fingerprinter fingerprinter(kDim);

  bool threw = false;
  try {
    fingerprinter.Bucket(std::vector<float>(kDim + 1, 0.1f));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidBitCountThrows() {
  bool threw = false;
  try {
    Fingerprinter fingerprinter(kDim, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestStripesWrapAround() {
  FingerprintLockTable table;
  assert(&table.For(3) == &table.For(3 + FingerprintLockTable::kStripeCount));
  assert(&table.For(3) != &table.For(4));
}

} // namespace

int main() {
  TestBucketsAreStableAcrossInstances();
  TestIdenticalEmbeddingsShareBucket();
  TestBucketRespectsBitWidth();
  TestDimensionMismatchThrows();
  TestInvalidBitCountThrows();
  TestStripesWrapAround();

  std::cout << "artscan_unit_fingerprint_lock: pass\n";
  return 0;
}
