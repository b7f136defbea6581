//  status.cpp -- report the printer status
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

#include <signal.h>

#include <csignal>
#include <cstdlib>

#include <exception>
#include <iostream>
#include <string>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <insatsu/log.hpp>
#include <insatsu/memory.hpp>
#include <insatsu/run-time.hpp>

#include "drivers/escpos/exception.hpp"
#include "drivers/escpos/printer.hpp"

#include "device-options.hpp"

namespace po = boost::program_options;

using namespace insatsu;
using namespace insatsu::_drv_::escpos;

namespace {

volatile std::sig_atomic_t interrupted = 0;

void
request_interruption (int)
{
  interrupted = 1;
}

//! Wrap signal registration platform dependencies
void
set_signal (int sig, void (*handler) (int))
{
  const std::string msg_failed
    ("cannot set signal handler (%1%)");
  const std::string msg_revert
    ("restoring default signal ignore behaviour (%1%)");

  struct sigaction sa;
  sa.sa_handler = handler;
  sa.sa_flags = 0;
  sigemptyset (&sa.sa_mask);

  struct sigaction rv;

  if (0 != sigaction (sig, &sa, &rv))
    {
      log::error (msg_failed) % sig;
      return;
    }
  if (SIG_IGN == rv.sa_handler && SIG_IGN != handler)
    {
      log::brief (msg_revert) % sig;
      sigaction (sig, &rv, 0);
    }
}

typedef std::string (printer::*query) ();

void
show (std::ostream& os, printer& p, const std::string& label, query q)
{
  os << label << ": ";
  try
    {
      os << (p.*q) () << "\n";
    }
  catch (const unsupported& e)
    {
      os << e.what () << "\n";
    }
}

void
show_info (std::ostream& os, printer& p)
{
  show (os, p, "serial number"  , &printer::get_serial_number);
  show (os, p, "ROM version"    , &printer::get_rom_version);
  show (os, p, "cut count"      , &printer::get_cut_count);
  show (os, p, "power-on count" , &printer::get_power_on_count);
  show (os, p, "printed length" , &printer::get_printed_length);
  show (os, p, "remaining paper", &printer::get_remaining_paper);

  os << "paper loaded: " << (p.is_paper_loaded () ? "yes" : "no") << "\n";
}

}       // namespace

int
main (int argc, char *argv[])
{
  int rv = EXIT_SUCCESS;

  try
    {
      run_time rt (argc, argv);

      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      po::options_description cmd_opts ("Utility options");
      cmd_opts
        .add_options ()
        ("monitor", po::bool_switch (),
         "enable automatic status back and report status changes until"
         " interrupted")
        ("info", po::bool_switch (),
         "also report the printer's maintenance counters")
        ;

      device_options dev_opts;

      po::options_description cmd_line;
      cmd_line
        .add (cmd_opts)
        .add (dev_opts.description ())
        ;

      if (rt.count ("help"))
        {
          std::cout << rt.help ("report the printer status")
                    << "\n"
                    << cmd_opts
                    << "\n"
                    << dev_opts.description ();
          return EXIT_SUCCESS;
        }

      po::variables_map vm;
      po::store (po::command_line_parser (rt.arguments ())
                 .options (cmd_line)
                 .run (), vm);
      po::notify (vm);

      shared_ptr< printer > p (dev_opts.open (vm));

      if (vm["info"].as< bool > ())
        show_info (std::cout, *p);

      if (!vm["monitor"].as< bool > ())
        {
          status s (p->get_status ());

          std::cout << s << "\n";
          if (s.is_fault ()) rv = EXIT_FAILURE;
        }
      else
        {
          set_signal (SIGTERM, request_interruption);
          set_signal (SIGINT , request_interruption);
          set_signal (SIGHUP , request_interruption);

          p->enable_asb ();

          status_monitor mon (*p);
          while (!interrupted)
            {
              boost::optional< status > s (mon.poll ());
              if (s) std::cout << *s << std::endl;
            }
        }
    }
  catch (const boost::exception& e)
    {
      std::cerr << boost::diagnostic_information (e);
      return EXIT_FAILURE;
    }
  catch (const std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return rv;
}
