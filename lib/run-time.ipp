//  run-time.ipp -- implementation details
//  Copyright (C) 2012  SEIKO EPSON CORPORATION
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

#ifndef lib_run_time_ipp_
#define lib_run_time_ipp_

//  Implementation state of run_time.  Unit tests include this to get
//  at instance_ so they can start every test case afresh.

#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/program_options/variables_map.hpp>

#include "insatsu/run-time.hpp"

namespace insatsu {

class run_time::impl
{
public:
  //! Handles the standard options and \c INSATSU_* variables
  /*! Whatever follows the first option or argument not recognized is
   *  left in cmd_args_ for the command to deal with.
   */
  impl (int argc, const char *const argv[]);

  static impl *instance_;

  boost::filesystem::path argzero_;
  std::string command_;

  boost::program_options::variables_map vm_;
  run_time::sequence_type cmd_args_;

  std::string shell_;

  static const std::string command_prefix_;
};

} // namespace insatsu

#endif /* lib_run_time_ipp_ */
