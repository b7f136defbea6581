//  log.hpp -- formatted messages based on priority and category
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
//  Copyright (C) 2026  Insatsu contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Insatsu' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifndef insatsu_log_hpp_
#define insatsu_log_hpp_

#include <ostream>
#include <sstream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>
#include <boost/throw_exception.hpp>

#include "format.hpp"
#include "thread.hpp"

#ifndef INSATSU_LOG_ARGUMENT_COUNT_CHECK_ENABLED
#define INSATSU_LOG_ARGUMENT_COUNT_CHECK_ENABLED true
#endif

namespace insatsu {

class log
{
public:
  typedef enum {
    FATAL,                      //!<  famous last words
    ALERT,                      //!<  outside intervention required
    ERROR,                      //!<  something went wrong
    BRIEF,                      //!<  short informational notes
    TRACE,                      //!<  more chattery feedback
    DEBUG                       //!<  the gory details
  } priority;

  typedef enum {
    NOTHING,
    ESCPOS_DRIVER = 1 << 0,     //!<  command encoding and status
    CONNEXION     = 1 << 1,     //!<  printer traffic
    ALL = ~0
  } category;

  static const bool
  arg_count_checking = INSATSU_LOG_ARGUMENT_COUNT_CHECK_ENABLED;

  //!  The priority at and above which messages may be logged
  static priority threshold;
  //!  The categories for which messages will be logged
  static category matching;

  //!  Where messages end up, std::clog unless redirected
  static std::ostream& os_;

  //!  Maps a case-insensitive priority name to its priority
  /*!  Accepts the priority names as well as their numeric values.
   *   Returns \c false and leaves \a level alone if \a name is not
   *   recognized.
   */
  static bool to_priority (const std::string& name, priority& level);

  static const char * name (priority level);

  //!  Formatted, self-outputting log messages
  /*!  A message is a boost::format that writes itself to log::os_
   *   when it goes out of scope.  Every line is tagged with a time
   *   stamp, the thread and the message's priority and category.
   *
   *   Arguments fed to messages that will not be output because of
   *   log::threshold or log::matching are only counted.  Nothing is
   *   formatted for them.
   */
  class message
  {
  public:
    typedef boost::format format_type;

    message ()
      : arg_(0), cnt_(0), dumped_(false)
    {}

#define expand_ctor(type)                                               \
    message (int lvl, type fmt)                                         \
      : arg_(0), dumped_(false)                                         \
    { init_(format_type (fmt), lvl, ALL); }                             \
    message (int lvl, int cat, type fmt)                                \
      : arg_(0), dumped_(false)                                         \
    { init_(format_type (fmt), lvl, cat); }                             \
    /**/

    expand_ctor (const format_type&);
    expand_ctor (const std::string&);
    expand_ctor (const char *);

#undef expand_ctor

    //  Overloads that only perform argument count checking
    message (const format_type& fmt, bool)
      : arg_(fmt.fed_args ()), cnt_(fmt.expected_args ()), dumped_(false)
    {}
    message (const std::string& fmt, bool)
      : arg_(0), cnt_(format_type (fmt).expected_args ()), dumped_(false)
    {}
    message (const char *fmt, bool)
      : arg_(0), cnt_(format_type (fmt).expected_args ()), dumped_(false)
    {}

    //  Arguments that were never fed are filled in with their
    //  placeholder so that the message still makes it out.
    ~message ()
    {
      if (arg_ < cnt_)
        {
          if (arg_count_checking)
            {
              log::error ("log::message::too_few_args: %1% < %2%")
                % arg_
                % cnt_;
            }
          for (int i = arg_; i < cnt_; /**/)
            {
              std::ostringstream os;
              os << "%" << ++i << "%";
              *this % os.str ();
            }
        }
      os_ << *this;
    }

    //!  Feeds the argument \a t to a message
    template <typename T> message& operator% (const T& t)
    {
      if (dumped_) arg_ = 0;
      ++arg_;
      if (fmt_)
        {
          *fmt_ % t;
        }
      else if (arg_count_checking && arg_ > cnt_)
        {
          BOOST_THROW_EXCEPTION (boost::io::too_many_args (arg_, cnt_));
        }
      return *this;
    }

    friend std::ostream& operator<< (std::ostream& os, const message& msg);

    operator std::string () const
    {
      std::string rv;

      if (fmt_)
        {
          std::ostringstream os;
          os << *timestamp_ << "[" << *thread_id_ << "] "
             << tag_ << ": " << *fmt_
             << std::endl;
          rv = os.str ();
        }
      else if (arg_count_checking && arg_ < cnt_)
        {
          BOOST_THROW_EXCEPTION (boost::io::too_few_args (arg_, cnt_));
        }
      dumped_ = true;
      return rv;
    }

  private:
    void init_(const format_type& fmt, int lvl, int cat)
    {
      if (!make_noise (lvl, cat))
        {
          cnt_ = fmt.expected_args ();
          return;
        }

      timestamp_ = boost::posix_time::microsec_clock::local_time ();
      thread_id_ = this_thread::get_id ();
      fmt_ = fmt;
      cnt_ = fmt_->expected_args ();

      //  Only messages for a single category get its name in their tag
      tag_ = name (priority (lvl));
      /**/ if (ESCPOS_DRIVER == cat) tag_ += "/escpos";
      else if (CONNEXION     == cat) tag_ += "/cnx";

      if (!arg_count_checking)
        fmt_->exceptions (fmt_->exceptions ()
                          & ~(boost::io::too_many_args_bit
                              | boost::io::too_few_args_bit));
    }

    boost::optional< boost::posix_time::ptime > timestamp_;
    boost::optional< thread::id >               thread_id_;
    boost::optional< format_type >              fmt_;
    std::string tag_;
    int arg_;
    int cnt_;
    mutable bool dumped_;
  };

  //!  Prioritized log messages
  /*!  The named constructors only produce output when the priority
   *   and category match.  This allows for concise code like
   *
   *     \code
   *     log::error ("short write: %1% of %2% octets") % n % size;
   *     log::trace (log::ESCPOS_DRIVER, "settling for %1%s") % t;
   *     \endcode
   */
#define expand_named_ctors(ctor,level)                          \
  template <typename fmtT>                                      \
  static message ctor (const fmtT& fmt)                         \
  { return make_message_(level, ALL, fmt); }                    \
  template <typename fmtT>                                      \
  static message ctor (category cat, const fmtT& fmt)           \
  { return make_message_(level, cat, fmt); }                    \
  /**/

  expand_named_ctors (fatal, FATAL);
  expand_named_ctors (alert, ALERT);
  expand_named_ctors (error, ERROR);
  expand_named_ctors (brief, BRIEF);
  expand_named_ctors (trace, TRACE);
  expand_named_ctors (debug, DEBUG);

#undef expand_named_ctors

private:
  static bool make_noise (int level, int cat = ALL)
  {
    return (threshold >= level && matching & cat);
  }

  template <typename fmtT>
  static message make_message_(priority level, int cat, const fmtT& fmt)
  {
    if (make_noise (level, cat))
      return message (level, cat, fmt);
    if (!arg_count_checking)
      return message ();
    return message (fmt, arg_count_checking);
  }
};

//! Outputs a formatted log message to a stream
inline std::ostream&
operator<< (std::ostream& os, const log::message& msg)
{
  os << std::string (msg);
  return os;
}

}       // namespace insatsu

#endif  /* insatsu_log_hpp_ */
