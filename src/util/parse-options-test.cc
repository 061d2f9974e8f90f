// util/parse-options-test.cc

// Copyright 2009-2011  Microsoft Corporation
//           2026       Alignkit Authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#include <cstdio>

#include "util/parse-options.h"

namespace alignkit {

struct DummyOptions {
  int32 my_int;
  bool my_bool;
  std::string my_string;
  double my_double;
  DummyOptions():
      my_int(0), my_bool(true), my_string("default dummy string"),
      my_double(0.1) { }

  void Register(OptionsItf *opts) {
    opts->Register("my-int", &my_int, "An int32 variable");
    opts->Register("my-bool", &my_bool, "A Boolean varaible");
    opts->Register("my-str", &my_string, "A string varaible");
    opts->Register("my-double", &my_double, "A double variable");
  }
};


void UnitTestParseOptions() {
  int argc = 7;
  std::string str="default_for_str";
  int32 num = 1;
  uint32 unum = 2;
  const char *argv[7] = { "program_name", "--unum=5", "--num=3", "--i=boo",
    "a", "b", "c" };
  ParseOptions po("my usage msg");
  po.Register("i", &str, "My variable");
  po.Register("num", &num, "My int32 variable");
  po.Register("unum", &unum, "My uint32 variable");
  po.Read(argc, argv);
  ALIGNKIT_ASSERT(po.NumArgs() == 3);
  ALIGNKIT_ASSERT(po.GetArg(1) == "a");
  ALIGNKIT_ASSERT(po.GetArg(2) == "b");
  ALIGNKIT_ASSERT(po.GetArg(3) == "c");
  ALIGNKIT_ASSERT(po.GetOptArg(4) == "");
  ALIGNKIT_ASSERT(unum == 5);
  ALIGNKIT_ASSERT(num == 3);
  ALIGNKIT_ASSERT(str == "boo");

  ParseOptions po2("my another usage msg");
  const char *argv2[4] = { "program_name", "--i=foo",
                           "--to-be-NORMALIZED=test", "c" };
  std::string str2 = "default_for_str2";
  po2.Register("To_Be_Normalized", &str2, "My variable (normalized)");
  po2.Register("i", &str, "My variable");
  po2.Read(4, argv2);
  ALIGNKIT_ASSERT(po2.NumArgs() == 1);
  ALIGNKIT_ASSERT(po2.GetArg(1) == "c");
  ALIGNKIT_ASSERT(str2 == "test");
  ALIGNKIT_ASSERT(str == "foo");

  // Options struct registered through the interface; bare --flag for bools.
  ParseOptions po3("and more");
  DummyOptions dummy_opts;
  dummy_opts.Register(&po3);
  const char *argv3[5] = { "program_name", "--my-bool=false", "--my-int=7",
                           "--my-double=2.5", "x" };
  po3.Read(5, argv3);
  ALIGNKIT_ASSERT(!dummy_opts.my_bool);
  ALIGNKIT_ASSERT(dummy_opts.my_int == 7);
  ALIGNKIT_ASSERT(dummy_opts.my_double == 2.5);
  ALIGNKIT_ASSERT(dummy_opts.my_string == "default dummy string");

  ParseOptions po4("bare flag");
  bool b = false;
  po4.Register("b", &b, "A bool");
  const char *argv4[3] = { "program_name", "--b", "arg" };
  po4.Read(3, argv4);
  ALIGNKIT_ASSERT(b && po4.NumArgs() == 1);

  // "--" ends the options; later "--x" are positional.
  ParseOptions po5("double dash");
  int32 n = 0;
  po5.Register("n", &n, "An int");
  const char *argv5[5] = { "program_name", "--n=2", "--", "--n=3", "y" };
  po5.Read(5, argv5);
  ALIGNKIT_ASSERT(n == 2 && po5.NumArgs() == 2 && po5.GetArg(1) == "--n=3");

  // An unknown option is fatal.
  try {
    ParseOptions po6("unknown");
    const char *argv6[2] = { "program_name", "--no-such-option=1" };
    po6.Read(2, argv6);
    ALIGNKIT_ERR << "Parsing an unknown option should have failed.";
  } catch (const AlignkitFatalError &e) {
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("no-such-option")
                    != std::string::npos);
  }

  // A bad integer value is fatal.
  bool threw = false;
  try {
    ParseOptions po7("bad int");
    int32 m = 0;
    po7.Register("m", &m, "An int");
    const char *argv7[2] = { "program_name", "--m=abc" };
    po7.Read(2, argv7);
  } catch (const AlignkitFatalError &e) {
    threw = true;
  }
  ALIGNKIT_ASSERT(threw);
}

void UnitTestReadConfigFile() {
  std::string filename = "tmp.parse-options-test.conf";
  {
    std::ofstream os(filename.c_str());
    os << "# a comment line\n"
       << "--my-int=42   # trailing comment\n"
       << "\n"
       << "--my-str=from config\n";
  }
  ParseOptions po("config file test");
  DummyOptions opts;
  opts.Register(&po);
  std::string config_arg = "--config=" + filename;
  const char *argv[4] = { "program_name", config_arg.c_str(),
                          "--my-int=43", "z" };
  po.Read(4, argv);
  // The command line overrides the config file.
  ALIGNKIT_ASSERT(opts.my_int == 43);
  ALIGNKIT_ASSERT(opts.my_string == "from config");
  ALIGNKIT_ASSERT(po.NumArgs() == 1 && po.GetArg(1) == "z");
  std::ostringstream config;
  po.PrintConfig(config);
  ALIGNKIT_ASSERT(config.str().find("my-int = 43") != std::string::npos);
  std::remove(filename.c_str());
}

void UnitTestEscape() {
  ALIGNKIT_ASSERT(ParseOptions::Escape("abc") == "abc");
  ALIGNKIT_ASSERT(ParseOptions::Escape("a b") == "'a b'");
  ALIGNKIT_ASSERT(ParseOptions::Escape("") == "''");
  ALIGNKIT_ASSERT(ParseOptions::Escape("it's") == "\"it's\"");
}

}  // end namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestParseOptions();
  UnitTestReadConfigFile();
  UnitTestEscape();
  std::cout << "Test OK.\n";
  return 0;
}
