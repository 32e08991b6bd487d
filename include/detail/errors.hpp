// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#ifndef MEDREDUCE_ERRORS_HPP
#define MEDREDUCE_ERRORS_HPP

#include <sstream>
#include <stdexcept>
#include <string>

namespace medreduce {

class error : public std::runtime_error
{
  public:
    explicit error(std::string const &what)
      : std::runtime_error(what)
    {
    }
};

// a line of input that does not carry the positional fields of a record
class malformed_record_error : public error
{
  public:
    malformed_record_error(std::string const &line,
                           size_t      const  tokens,
                           std::string const &source      = std::string(),
                           size_t      const  line_number = 0)
      : error(describe(line, tokens, source, line_number)),
        line_(line),
        tokens_(tokens),
        source_(source),
        line_number_(line_number)
    {
    }

    std::string const &line()        const { return line_; }
    size_t      const  tokens()      const { return tokens_; }
    std::string const &source()      const { return source_; }
    size_t      const  line_number() const { return line_number_; }

  private:
    static std::string describe(std::string const &line,
                                size_t      const  tokens,
                                std::string const &source,
                                size_t      const  line_number)
    {
        std::ostringstream what;
        what << "malformed record";
        if (!source.empty())
            what << " in " << source << " line " << line_number;
        what << ": expected 6 fields, found " << tokens << " in \"" << line << "\"";
        return what.str();
    }

  private:
    std::string line_;
    size_t      tokens_;
    std::string source_;
    size_t      line_number_;
};

class io_error : public error
{
  public:
    io_error(std::string const &path, std::string const &reason)
      : error(reason + ": " + path),
        path_(path)
    {
    }

    std::string const &path() const { return path_; }

  private:
    std::string path_;
};

// a lease request found nothing to hand out; the caller decides what that means
class no_tasks_available : public error
{
  public:
    explicit no_tasks_available(std::string const &what)
      : error(what)
    {
    }
};

class pool_exhausted : public no_tasks_available
{
  public:
    explicit pool_exhausted(std::string const &pool)
      : no_tasks_available("no more " + pool + " tasks"),
        pool_(pool)
    {
    }

    std::string const &pool() const { return pool_; }

  private:
    std::string pool_;
};

class rpc_error : public error
{
  public:
    explicit rpc_error(std::string const &what)
      : error(what)
    {
    }
};

class configuration_error : public error
{
  public:
    explicit configuration_error(std::string const &what)
      : error(what)
    {
    }
};

}   // namespace medreduce

#endif  // MEDREDUCE_ERRORS_HPP

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
