//  run-time.cpp -- program run-time information
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include "insatsu/format.hpp"
#include "insatsu/log.hpp"

#include "run-time.ipp"

#define DEFAULT_SHELL "/bin/sh"

namespace insatsu {

namespace fs = boost::filesystem;
namespace po = boost::program_options;

using std::logic_error;
using std::runtime_error;

run_time::impl *run_time::impl::instance_(0);

const std::string run_time::impl::command_prefix_(PACKAGE_TARNAME "-");

run_time::run_time (int argc, const char *const argv[])
{
  if (impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has been initialized already"));

  impl::instance_ = new impl (argc, argv);
}

run_time::run_time ()
{
  if (!impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has not been initialized yet"));
}

std::string
run_time::program () const
{
  return PACKAGE_TARNAME;
}

std::string
run_time::command () const
{
  return impl::instance_->command_;
}

const run_time::sequence_type&
run_time::arguments () const
{
  return impl::instance_->cmd_args_;
}

std::string
run_time::locate (const std::string& command) const
{
  fs::path rv (impl::instance_->argzero_.parent_path ()
               / (impl::command_prefix_ + command));

  rv = rv.native () + impl::instance_->argzero_.extension ().native ();

  if (!fs::exists (rv))
    log::trace ("%1%: no such file") % rv.string ();

  return rv.string ();
}

void
run_time::execute (const std::string& shell_command) const
{
  execl (impl::instance_->shell_.c_str (),
         impl::instance_->shell_.c_str (),
         "-c",
         shell_command.c_str (),
         NULL);

  int err_code = errno;
  BOOST_THROW_EXCEPTION (runtime_error (strerror (err_code)));
}

po::variables_map::size_type
run_time::count (const po::variables_map::key_type& option) const
{
  return impl::instance_->vm_.count (option);
}

const po::variable_value&
run_time::operator[] (const std::string& option) const
{
  return impl::instance_->vm_[option];
}

std::string
run_time::help (const std::string& summary) const
{
  format fmt (!command ().empty ()
              ? "%1% %2% -- %3%\n"
              : "%1% -- %3%\n");
  return (fmt
          % program ()
          % command ()
          % summary).str ();
}

std::string
run_time::version (const std::string& legalese,
                   const std::string& disclaimer) const
{
  static const std::string default_legalese
    ("Copyright (C) 2026  Insatsu contributors\n"
     "License: GPL-3.0+");

  format fmt (!command ().empty ()
              ? "%1% %2% (%3%) %4%\n%5%\n%6%\n"
              : "%1% (%3%) %4%\n%5%\n%6%\n");
  return (fmt
          % program ()
          % command ()
          % PACKAGE_NAME
          % PACKAGE_VERSION
          % (legalese.empty ()
             ? default_legalese
             : legalese)
          % disclaimer).str ();
}

static
bool
is_option (const std::string& s)
{
  return (0 == s.find ("-"));
}

namespace {

//  Marks every option from the first unregistered one onwards as
//  unregistered so that they are passed on to the command.
struct unrecognize
{
  bool found_first_;

  unrecognize (const std::vector< po::option >::iterator& it)
    : found_first_(false)
  {
    if (std::vector< po::option >::iterator () != it)
      operator() (*it);
  }

  po::option
  operator() (po::option& item)
  {
    found_first_ |= item.string_key.empty ();
    found_first_ |= item.unregistered;
    item.unregistered = found_first_;

    return item;
  }
};

//! Maps INSATSU_SOME_OPTION onto the some-option option
struct env_var_mapper
{
  po::options_description opts_;

  enum { approx = true, exact = false };

  env_var_mapper (const po::options_description& opts)
    : opts_(opts)
  {}

  std::string
  operator() (const std::string& env_var)
  {
    static const std::string prefix (PACKAGE_ENV_VAR_PREFIX);

    if (0 != env_var.find (prefix))
      return std::string ();

    std::string option (env_var.substr (prefix.length ()));
    boost::algorithm::to_lower (option);
    boost::algorithm::replace_all (option, "_", "-");

    if (opts_.find_nothrow (option, exact))
      return option;

    return std::string ();
  }
};

}       // namespace

run_time::impl::impl (int argc, const char *const argv[])
  : argzero_(argv[0])
  , shell_(DEFAULT_SHELL)
{
  run_time::sequence_type args (argv + 1, argv + argc);

  po::options_description cli_args;
  cli_args
    .add_options ()
    ("help"   , "display this help and exit")
    ("version", "output version information and exit")
    ("log-level", po::value< std::string > (),
     "log messages at and above this priority (fatal, alert, error,"
     " brief, trace or debug)")
    ;

  po::options_description env_args;
  env_args
    .add_options ()
    ("log-level", po::value< std::string > ())
    ("shell", (po::value< std::string > (&shell_)
               -> default_value (DEFAULT_SHELL)))
    ;

  po::parsed_options cmd_line (po::command_line_parser (args)
                               .options (cli_args)
                               .allow_unregistered ()
                               .run ());

  std::transform (cmd_line.options.begin (), cmd_line.options.end (),
                  cmd_line.options.begin (),
                  unrecognize (cmd_line.options.begin ()));

  po::store (cmd_line, vm_);
  po::store (po::parse_environment (env_args, env_var_mapper (env_args)), vm_);
  po::notify (vm_);

  if (vm_.count ("log-level"))
    {
      std::string name (vm_["log-level"].as< std::string > ());
      log::priority level;

      if (!log::to_priority (name, level))
        BOOST_THROW_EXCEPTION
          (po::invalid_option_value (name));

      log::threshold = level;
    }

  cmd_args_ = po::collect_unrecognized (cmd_line.options,
                                        po::include_positional);

  std::string cmd_name (argzero_.stem ().string ());

  if (0 == cmd_name.find (command_prefix_))
    cmd_name.erase (0, command_prefix_.length ());
  if (!(PACKAGE_TARNAME == cmd_name || "main" == cmd_name))
    command_ = cmd_name;

  if (command_.empty ())
    {
      if (!cmd_args_.empty ()
          && !is_option (cmd_args_.front ()))
        {
          command_ = cmd_args_.front ();
          cmd_args_.erase (cmd_args_.begin ());
        }
    }
}

} // namespace insatsu
