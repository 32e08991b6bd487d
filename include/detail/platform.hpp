// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <fstream>
#include <iostream>
#include <boost/filesystem.hpp>
#include <boost/system/system_error.hpp>

namespace medreduce {

namespace detail {

inline bool const delete_file(std::string const &pathname)
{
    if (pathname.empty())
        return true;

    bool success = false;
    try
    {
#ifdef DEBUG_TRACE_OUTPUT
        std::clog << "\ndeleting " << pathname;
#endif
        success = boost::filesystem::remove(pathname);
    }
    catch (std::exception &e)
    {
        std::cerr << "Error deleting file \"" << pathname << "\"\n" << e.what() << "\n";
    }
    return success;
}

inline void create_directories(std::string const &directory)
{
    if (directory.empty())
        return;

    boost::system::error_code ec;
    boost::filesystem::create_directories(directory, ec);
    if (ec)
        BOOST_THROW_EXCEPTION(io_error(directory, "failed to create directory (" + ec.message() + ")"));
}

// the temporary lives beside its destination so the final rename stays
// on one filesystem
inline std::string const get_temporary_filename(std::string const &destination)
{
    boost::filesystem::path const path(destination);
    return (path.parent_path()
          / boost::filesystem::unique_path(path.filename().string() + ".%%%%-%%%%.tmp")).string();
}

inline void rename_file(std::string const &from, std::string const &to)
{
    boost::system::error_code ec;
    boost::filesystem::rename(from, to, ec);
    if (ec)
        BOOST_THROW_EXCEPTION(io_error(to, "failed to rename " + from + " (" + ec.message() + ")"));
}

// Output file that only appears under its real name once commit() succeeds.
// A reader never sees a partially written file, and a writer that fails
// (or never commits) leaves nothing behind.
class committed_file : noncopyable
{
  public:
    explicit committed_file(std::string const &filename)
      : filename_(filename),
        temporary_filename_(get_temporary_filename(filename)),
        committed_(false)
    {
        stream_.open(temporary_filename_.c_str(), std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
        if (!stream_.is_open())
            BOOST_THROW_EXCEPTION(io_error(filename_, "failed to create file"));
    }

    ~committed_file()
    {
        if (!committed_)
        {
            stream_.close();
            delete_file(temporary_filename_);
        }
    }

    std::ostream &stream()
    {
        return stream_;
    }

    std::string const &filename() const
    {
        return filename_;
    }

    void commit()
    {
        stream_.flush();
        stream_.close();
        if (stream_.fail())
            BOOST_THROW_EXCEPTION(io_error(filename_, "failed to write file"));

        rename_file(temporary_filename_, filename_);
        committed_ = true;
    }

  private:
    std::string   filename_;
    std::string   temporary_filename_;
    std::ofstream stream_;
    bool          committed_;
};

}   // namespace detail

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
