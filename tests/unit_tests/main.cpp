// Copyright (c) 2022, The Monero Project
// 
// All rights reserved.
// 
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
// 
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
// 
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
// 
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
// 
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "crypto/ristretto_ops.h"
#include "misc_log_ex.h"

#include "gtest/gtest.h"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char** argv)
{
  TRY_ENTRY();

  ::testing::InitGoogleTest(&argc, argv);

  po::options_description desc_options("Command line options");
  desc_options.add_options()
    ("help", "Produce help message")
    ("log-file", po::value<std::string>()->default_value(""), "Log file path")
    ("log-level", po::value<std::string>()->default_value(""), "Log categories and levels (e.g. \"clsag:DEBUG\")");

  po::variables_map vm;
  try
  {
    po::store(po::parse_command_line(argc, argv, desc_options), vm);
    po::notify(vm);
  }
  catch (const po::error &e)
  {
    std::cerr << "Failed to parse arguments: " << e.what() << std::endl;
    return 1;
  }

  if (vm.count("help"))
  {
    std::cout << desc_options << std::endl;
    return 0;
  }

  const std::string log_file{vm["log-file"].as<std::string>()};
  mlog_configure(log_file.empty() ? mlog_get_default_log_path("unit_tests.log") : log_file, true);
  if (!vm["log-level"].as<std::string>().empty())
    mlog_set_log(vm["log-level"].as<std::string>().c_str());

  clsag::crypto::init_backend();

  CATCH_ENTRY_L0("main", 1);

  return RUN_ALL_TESTS();
}
