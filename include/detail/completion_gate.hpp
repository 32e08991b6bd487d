// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace medreduce {

// One-shot signal. fire() flips it exactly once and releases every waiter;
// later calls return false and change nothing.
class completion_gate : detail::noncopyable
{
  public:
    completion_gate() : fired_(false)
    {
    }

    bool const fire()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fired_)
                return false;
            fired_ = true;
        }
        condition_.notify_all();
        return true;
    }

    bool const fired() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

    // no timeout, blocks for as long as nobody fires the gate
    void wait() const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return fired_; });
    }

    template<typename Rep, typename Period>
    bool const wait_for(std::chrono::duration<Rep, Period> const &timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, timeout, [this] { return fired_; });
    }

  private:
    mutable std::mutex              mutex_;
    mutable std::condition_variable condition_;
    bool                            fired_;
};

}   // namespace medreduce

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.
