// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <deque>
#include <mutex>
#include <vector>

namespace medreduce {

// The task indices 0..size-1, each handed out at most once. Nothing is ever
// put back, so a lost lease is never redelivered.
class task_pool : detail::noncopyable
{
  public:
    task_pool(std::string const &name, size_t const size)
      : name_(name),
        leased_(size, false)
    {
        for (size_t index=0; index<size; ++index)
            available_.push_back(index);
    }

    // throws pool_exhausted once every index has been leased
    size_t const lease()
    {
        size_t index;
        if (!try_lease(index))
            BOOST_THROW_EXCEPTION(pool_exhausted(name_));
        return index;
    }

    bool const try_lease(size_t &index)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_.empty())
            return false;

        index = available_.front();
        available_.pop_front();
        leased_[index] = true;
        return true;
    }

    bool const leased(size_t const index) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return index < leased_.size()  &&  leased_[index];
    }

    size_t const available() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_.size();
    }

    bool const exhausted() const
    {
        return available() == 0;
    }

    size_t const size() const
    {
        return leased_.size();
    }

    std::string const &name() const
    {
        return name_;
    }

  private:
    std::string const  name_;
    mutable std::mutex mutex_;
    std::deque<size_t> available_;
    std::vector<bool>  leased_;
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
