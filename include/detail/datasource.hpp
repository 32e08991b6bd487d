// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

namespace medreduce {

namespace datasource {

// Every regular file in the directory carrying the extension, sorted so a
// partition keeps the same map task index from run to run. Files for which
// skip(path) is true are left out.
template<typename SkipFn>
std::vector<std::string> list_partitions(std::string const &directory,
                                         std::string const &extension,
                                         SkipFn             skip)
{
    typedef boost::filesystem::path               path_t;
    typedef boost::filesystem::directory_iterator it_dir_t;

    std::vector<std::string> partitions;
    try
    {
        if (!boost::filesystem::is_directory(directory))
            BOOST_THROW_EXCEPTION(io_error(directory, "input is not a directory"));

        for (it_dir_t it_dir(directory); it_dir!=it_dir_t(); ++it_dir)
        {
            if (boost::filesystem::is_directory(it_dir->status()))
                continue;

            path_t const &path = it_dir->path();
            if (path.extension().string() != extension  ||  skip(path))
                continue;

            partitions.push_back(path.string());
        }
    }
    catch (boost::filesystem::filesystem_error &e)
    {
        BOOST_THROW_EXCEPTION(io_error(directory, e.what()));
    }

    std::sort(partitions.begin(), partitions.end());
    return partitions;
}

inline std::vector<std::string> list_partitions(std::string const &directory, std::string const &extension)
{
    return list_partitions(directory, extension, [](boost::filesystem::path const &) { return false; });
}

// line by line reader over one input source
class line_reader : ::medreduce::detail::noncopyable
{
  public:
    explicit line_reader(std::string const &filename)
      : filename_(filename),
        line_number_(0)
    {
        file_.open(filename_.c_str(), std::ios_base::in | std::ios_base::binary);
        if (!file_.is_open())
            BOOST_THROW_EXCEPTION(io_error(filename_, "failed to open file"));
    }

    bool const next(std::string &line)
    {
        if (!std::getline(file_, line))
        {
            if (file_.bad())
                BOOST_THROW_EXCEPTION(io_error(filename_, "failed to read file"));
            return false;
        }

        // strip CR if present (Windows line endings)
        if (!line.empty()  &&  line[line.length()-1] == '\r')
            line.erase(line.length()-1);

        ++line_number_;
        return true;
    }

    std::string const &filename() const
    {
        return filename_;
    }

    size_t const line_number() const
    {
        return line_number_;
    }

  private:
    std::string   filename_;
    std::ifstream file_;
    size_t        line_number_;
};

}   // namespace datasource

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
