// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CANCELLATION_TOKEN_H
#define __CANCELLATION_TOKEN_H 1

#include <atomic>

namespace mkc_measurement
{
  //
  // class CancellationToken
  //
  // Set by the caller, polled by the importer before each file starts.
  // A file already being parsed always finishes.
  //

  class CancellationToken
  {
  public:
    CancellationToken()
      : mCancelled(false)
    {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel()
    {
      mCancelled.store(true, std::memory_order_release);
    }

    bool isCancelled() const
    {
      return mCancelled.load(std::memory_order_acquire);
    }

  private:
    std::atomic<bool> mCancelled;
  };
} // namespace mkc_measurement

#endif // __CANCELLATION_TOKEN_H
