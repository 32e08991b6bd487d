// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include "medreduce.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <boost/filesystem.hpp>

namespace medreduce_test {

// A fresh directory under the system temporary directory, removed with
// everything in it when the fixture goes out of scope.
class scratch_directory : medreduce::detail::noncopyable
{
  public:
    scratch_directory()
      : path_(boost::filesystem::temp_directory_path()
            / boost::filesystem::unique_path("medreduce-test-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(path_);
    }

    ~scratch_directory()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path_, ec);
    }

    std::string const path() const
    {
        return path_.string();
    }

    std::string const path(std::string const &leaf) const
    {
        return (path_ / leaf).string();
    }

    std::string const write(std::string const &leaf, std::string const &contents) const
    {
        std::string const filename = path(leaf);
        std::ofstream file(filename.c_str(), std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
        file << contents;
        return filename;
    }

    bool const exists(std::string const &leaf) const
    {
        return boost::filesystem::exists(path_ / leaf);
    }

  private:
    boost::filesystem::path const path_;
};

inline std::string const read_file(std::string const &filename)
{
    std::ifstream file(filename.c_str(), std::ios_base::in | std::ios_base::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// input partitions are read from <scratch>/input, intermediates and the
// report are written to <scratch>/intermediate and <scratch>/reduce-out.txt
inline medreduce::specification make_spec(scratch_directory const &scratch)
{
    medreduce::specification spec;
    spec.input_directory        = scratch.path("input");
    spec.intermediate_directory = scratch.path("intermediate");
    spec.output_filespec        = scratch.path("reduce-out.txt");
    spec.coordinator_port       = 0;
    boost::filesystem::create_directories(spec.input_directory);
    return spec;
}

}   // namespace medreduce_test
