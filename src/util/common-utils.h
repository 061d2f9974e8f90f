// util/common-utils.h

// Copyright 2026  Alignkit Authors

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
#ifndef ALIGNKIT_UTIL_COMMON_UTILS_H_
#define ALIGNKIT_UTIL_COMMON_UTILS_H_

#include "base/alignkit-common.h"
#include "util/parse-options.h"
#include "util/alignkit-io.h"
#include "util/alignkit-thread.h"
#include "util/text-utils.h"

#endif  // ALIGNKIT_UTIL_COMMON_UTILS_H_
