//  print.cpp -- print text, barcodes and images
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

#include <cstdlib>

#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>
#include <insatsu/memory.hpp>
#include <insatsu/run-time.hpp>

#include "drivers/escpos/command.hpp"
#include "drivers/escpos/printer.hpp"

#include "device-options.hpp"
#include "pbm.hpp"

namespace po = boost::program_options;

using namespace insatsu;
using namespace insatsu::_drv_::escpos;

namespace {

void
print_image (printer& p, const std::string& filename, bool bit_mode,
             const std::string& mode)
{
  std::ifstream is (filename.c_str (), std::ios::binary);

  if (!is)
    BOOST_THROW_EXCEPTION
      (std::runtime_error ("cannot open '" + filename + "'"));

  pbm image (is);

  log::brief ("printing %1%x%2% image") % image.width () % image.height ();

  if (bit_mode)
    p.bit_image (image.bitmap (), to_density (mode));
  else
    p.raster (image.bitmap (), to_raster_mode (mode));
}

}       // namespace

int
main (int argc, char *argv[])
{
  try
    {
      run_time rt (argc, argv);

      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      std::vector< std::string > lines;

      po::options_description cmd_pos_opts;
      cmd_pos_opts
        .add_options ()
        ("TEXT", po::value< std::vector< std::string > > (&lines),
         "lines of text to print")
        ;

      po::positional_options_description cmd_pos_args;
      cmd_pos_args
        .add ("TEXT", -1)
        ;

      std::string encoding;
      std::string align;
      std::string image_mode;
      int feed;

      po::options_description cmd_opts ("Utility options");
      cmd_opts
        .add_options ()
        ("encoding", (po::value< std::string > (&encoding)
                      -> default_value ("CP437")),
         "character set the printer expects text in")
        ("align", (po::value< std::string > (&align)
                   -> default_value ("LT")),
         "text alignment: LT, CT or RT")
        ("barcode", po::value< std::string > (),
         "print a Code128 barcode of this text after the lines")
        ("image", po::value< std::string > (),
         "print a binary PBM (P4) image after the lines")
        ("bit-image", po::bool_switch (),
         "print the image in bit image bands rather than as a raster")
        ("image-mode", (po::value< std::string > (&image_mode)),
         "raster mode (NORMAL, DW, DH or QD) or bit image density"
         " (S8, D8, S24 or D24)")
        ("feed", (po::value< int > (&feed)
                  -> default_value (3)),
         "lines to feed before cutting")
        ;

      device_options dev_opts;

      po::options_description cmd_line;
      cmd_line
        .add (cmd_opts)
        .add (dev_opts.description ())
        .add (cmd_pos_opts)
        ;

      if (rt.count ("help"))
        {
          std::cout << rt.help ("print text, barcodes and images")
                    << "\n"
                    << cmd_opts
                    << "\n"
                    << dev_opts.description ()
                    << "\n"
                    << ("Lines of text are read from standard input when"
                        " none are given on the command-line and nothing"
                        " else is to be printed.\n");
          return EXIT_SUCCESS;
        }

      po::variables_map vm;
      po::store (po::command_line_parser (rt.arguments ())
                 .options (cmd_line)
                 .positional (cmd_pos_args)
                 .run (), vm);
      po::notify (vm);

      if (lines.empty () && !vm.count ("barcode") && !vm.count ("image"))
        {
          std::string line;
          while (std::getline (std::cin, line))
            lines.push_back (line);
        }

      shared_ptr< printer > p (dev_opts.open (vm, text_encoder (encoding)));

      *p << cmd::init ()
         << cmd::align (align);

      std::vector< std::string >::const_iterator it;
      for (it = lines.begin (); lines.end () != it; ++it)
        *p << cmd::println (*it);

      if (vm.count ("barcode"))
        {
          barcode_spec spec (CODE128);
          *p << cmd::barcode (spec, vm["barcode"].as< std::string > ());
        }

      if (vm.count ("image"))
        {
          print_image (*p, vm["image"].as< std::string > (),
                       vm["bit-image"].as< bool > (), image_mode);
        }

      *p << cmd::feed (feed)
         << cmd::partial_cut ();
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

  return EXIT_SUCCESS;
}
