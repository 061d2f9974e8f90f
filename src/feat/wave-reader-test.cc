// feat/wave-reader-test.cc

// Copyright 2017  Smart Action LLC (kkm)
//           2026  Alignkit Authors

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

#include <iostream>

#include <sstream>

#include "base/alignkit-math.h"
#include "feat/wave-reader.h"

using namespace alignkit;

// Ugly macros to package bytes in wave file order (low-endian).
#define BY(n,k) ((char)((uint32)(n) >> (8 * (k)) & 0xFF))
#define WRD(n) BY(n,0), BY(n,1)
#define DWRD(n) BY(n,0), BY(n,1), BY(n,2), BY(n,3)
// The same, in RIFX (big-endian) order.
#define BWRD(n) BY(n,1), BY(n,0)
#define BDWRD(n) BY(n,3), BY(n,2), BY(n,1), BY(n,0)

static void AssertSamplesEqual(const WaveData &wave,
                               const std::vector<std::vector<BaseFloat> > &expected) {
  ALIGNKIT_ASSERT(wave.NumChannels() == static_cast<int32>(expected.size()));
  for (size_t c = 0; c < expected.size(); c++) {
    ALIGNKIT_ASSERT(wave.Data()[c].size() == expected[c].size());
    for (size_t i = 0; i < expected[c].size(); i++)
      ALIGNKIT_ASSERT(wave.Data()[c][i] == expected[c][i]);
  }
}

static void UnitTestStereo8K() {
  /* Reference file written with Adobe Audition (random data):
00000000  52 49 46 46 32 00 00 00  57 41 56 45 66 6d 74 20  |RIFF2...WAVEfmt |
00000010  12 00 00 00 01 00 02 00  40 1f 00 00 00 7d 00 00  |........@....}..|
00000020  04 00 10 00 00 00 64 61  74 61 0c 00 00 00 00 00  |......data......|
00000030  31 51 ff 21 f4 63 38 4c  26 60                    |1Q.!.c8L&`|
  */

  const int hz = 8000;
  const int byps = hz * 2 /* channels */ * 2 /* bytes/sample */;
  const char file_data[] = {
    'R', 'I', 'F', 'F',
    DWRD(50),   // File length after this point.
    'W', 'A', 'V', 'E',
    'f', 'm', 't', ' ',
    DWRD(18),   // sizeof(struct WAVEFORMATEX)
    WRD(1),     // WORD  wFormatTag;
    WRD(2),     // WORD  nChannels;
    DWRD(hz),   // DWORD nSamplesPerSec; 40 1f 00 00
    DWRD(byps), // DWORD nAvgBytesPerSec; 00 7d 00 00
    WRD(4),     // WORD  nBlockAlign;
    WRD(16),    // WORD  wBitsPerSample;
    WRD(0),     // WORD  cbSize;
    'd', 'a', 't', 'a',
    DWRD(12),   // 'data' chunk length.
    WRD(0), WRD(-1),
    WRD(-32768), WRD(0),
    WRD(32767), WRD(1)
  };

  const BaseFloat row0[] = { 0, -32768, 32767 }, row1[] = { -1, 0, 1 };
  std::vector<std::vector<BaseFloat> > expected(2);
  expected[0].assign(row0, row0 + 3);
  expected[1].assign(row1, row1 + 3);

  // Read binary file data.
  std::istringstream iws(std::string(file_data, sizeof file_data),
                         std::ios::in | std::ios::binary);
  WaveData wave;
  wave.Read(iws);

  AssertEqual(wave.SampFreq(), hz, 0);
  AssertEqual(wave.Duration(), 3.0 /* samples */ / hz /* Hz */, 1E-6);
  AssertSamplesEqual(wave, expected);
}

// A canonical 16-bit PCM file; "riff_size" and "data_size" override the
// sizes in the header when not -1.
static std::string PcmFile(int32 hz, int32 num_chan,
                           const std::vector<int16> &samples,
                           int64 riff_size = -1, int64 data_size = -1) {
  int32 data_bytes = samples.size() * 2;
  if (data_size == -1) data_size = data_bytes;
  if (riff_size == -1) riff_size = 36 + data_bytes;
  const char header[] = {
    'R', 'I', 'F', 'F', DWRD(riff_size),
    'W', 'A', 'V', 'E',
    'f', 'm', 't', ' ', DWRD(16),
    WRD(1), WRD(num_chan), DWRD(hz), DWRD(hz * num_chan * 2),
    WRD(num_chan * 2), WRD(16),
    'd', 'a', 't', 'a', DWRD(data_size)
  };
  std::string ans(header, sizeof header);
  for (size_t i = 0; i < samples.size(); i++) {
    const char bytes[] = { WRD(samples[i]) };
    ans.append(bytes, 2);
  }
  return ans;
}

static void ReadFromString(const std::string &file_data, WaveData *wave) {
  std::istringstream is(file_data, std::ios::in | std::ios::binary);
  wave->Read(is);
}

static void UnitTestMono22K() {
  const int16 samples[] = { 0, -1, -32768, 32767, 1 };
  std::vector<int16> v(samples, samples + 5);
  WaveData wave;
  ReadFromString(PcmFile(22050, 1, v), &wave);

  std::vector<std::vector<BaseFloat> > expected(1);
  expected[0].assign(samples, samples + 5);
  AssertEqual(wave.SampFreq(), 22050, 0);
  AssertEqual(wave.Duration(), 5.0 / 22050, 1E-6);
  AssertSamplesEqual(wave, expected);
}

// Sizes of 0 or 0xFFFFFFFF mean the writer did not know the length, and
// the samples run to end of file.
static void UnitTestStreamed() {
  const int16 samples[] = { 1, 2, 3, 4 };
  std::vector<int16> v(samples, samples + 4);
  std::vector<std::vector<BaseFloat> > expected(1);
  expected[0].assign(samples, samples + 4);
  const int64 unknown_sizes[] = { 0, 0xFFFFFFFF };
  for (int32 i = 0; i < 2; i++) {
    WaveData wave;
    ReadFromString(PcmFile(8000, 1, v, unknown_sizes[i], unknown_sizes[i]),
                   &wave);
    AssertSamplesEqual(wave, expected);
  }
  // Two channels, interleaved.
  WaveData stereo;
  ReadFromString(PcmFile(8000, 2, v, 0, 0x7FFFF000), &stereo);
  ALIGNKIT_ASSERT(stereo.NumChannels() == 2 && stereo.NumSamples() == 2);
  ALIGNKIT_ASSERT(stereo.Data()[0][1] == 3 && stereo.Data()[1][1] == 4);
}

static void UnitTestTruncated() {
  std::vector<int16> v(10, 7);
  std::string file_data = PcmFile(16000, 1, v);
  file_data.resize(file_data.size() - 6);  // drop 3 samples.
  WaveData wave;
  ReadFromString(file_data, &wave);
  ALIGNKIT_ASSERT(wave.NumSamples() == 7);
}

static void UnitTestRifxWithJunk() {
  const int hz = 16000;
  const char file_data[] = {
    'R', 'I', 'F', 'X',
    BDWRD(54),
    'W', 'A', 'V', 'E',
    'J', 'U', 'N', 'K',
    BDWRD(4), 0, 0, 0, 0,
    'f', 'm', 't', ' ',
    BDWRD(16),
    BWRD(1),        // PCM
    BWRD(1),        // mono
    BDWRD(hz),
    BDWRD(hz * 2),
    BWRD(2),
    BWRD(16),
    'd', 'a', 't', 'a',
    BDWRD(6),
    BWRD(300), BWRD(-2), BWRD(-32768)
  };
  std::istringstream iws(std::string(file_data, sizeof file_data),
                         std::ios::in | std::ios::binary);
  WaveData wave;
  wave.Read(iws);

  const BaseFloat row0[] = { 300, -2, -32768 };
  std::vector<std::vector<BaseFloat> > expected(1);
  expected[0].assign(row0, row0 + 3);
  AssertEqual(wave.SampFreq(), hz, 0);
  AssertSamplesEqual(wave, expected);
}

static void UnitTestWriteClips() {
  const BaseFloat samples[] = { 40000.0, -40000.0, 12.7 };
  std::vector<std::vector<BaseFloat> > data(1);
  data[0].assign(samples, samples + 3);
  WaveData wave(8000, data);
  std::ostringstream os(std::ios::out | std::ios::binary);
  wave.Write(os);
  std::istringstream is(os.str(), std::ios::in | std::ios::binary);
  WaveData wave2;
  wave2.Read(is);
  ALIGNKIT_ASSERT(wave2.Data()[0][0] == 32767);
  ALIGNKIT_ASSERT(wave2.Data()[0][1] == -32768);
  ALIGNKIT_ASSERT(wave2.Data()[0][2] == 12);
}

static void UnitTestExtractRange() {
  // Two channels, 1000 Hz, one second.
  std::vector<std::vector<BaseFloat> > data(2, std::vector<BaseFloat>(1000));
  for (int32 i = 0; i < 1000; i++) {
    data[0][i] = i;
    data[1][i] = -i;
  }
  WaveData wave(1000, data);
  ALIGNKIT_ASSERT(wave.NumSamples() == 1000);
  AssertEqual(wave.Duration(), 1.0, 1E-6);

  WaveData range;
  wave.ExtractRange(100, 350, &range);
  ALIGNKIT_ASSERT(range.NumChannels() == 2 && range.NumSamples() == 250);
  ALIGNKIT_ASSERT(range.SampFreq() == 1000);
  ALIGNKIT_ASSERT(range.Data()[0][0] == 100 && range.Data()[0][249] == 349);
  ALIGNKIT_ASSERT(range.Data()[1][0] == -100 && range.Data()[1][249] == -349);

  wave.ExtractRange(0, 0, &range);
  ALIGNKIT_ASSERT(range.NumSamples() == 0);
}

static void UnitTestWriteRead() {
  const BaseFloat samples[] = { 0, 1, -1, 32767, -32768, 1234 };
  std::vector<std::vector<BaseFloat> > data(1);
  data[0].assign(samples, samples + 6);
  WaveData wave(16000, data);

  std::ostringstream os(std::ios::out | std::ios::binary);
  wave.Write(os);
  ALIGNKIT_ASSERT(os.str().size() == 44 + 6 * 2);  // canonical 44-byte header.

  std::istringstream is(os.str(), std::ios::in | std::ios::binary);
  WaveData wave2;
  wave2.Read(is);
  ALIGNKIT_ASSERT(wave2.SampFreq() == 16000);
  AssertSamplesEqual(wave2, data);
}

// A rate of 0 passes the byte-rate check, since 0 * block_align == 0, but
// would break every time-to-sample conversion.
static void UnitTestZeroSampleRate() {
  std::vector<int16> v(4, 100);
  WaveData wave;
  bool threw = false;
  try {
    ReadFromString(PcmFile(0, 1, v), &wave);
  } catch (const AlignkitFatalError &e) {
    threw = true;
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("sample rate") !=
                    std::string::npos);
  }
  ALIGNKIT_ASSERT(threw);
}

static void UnitTestNotWave() {
  std::istringstream is(std::string("this is not a wave file"),
                        std::ios::in | std::ios::binary);
  WaveData wave;
  bool threw = false;
  try {
    wave.Read(is);
  } catch (const AlignkitFatalError &e) {
    threw = true;
  }
  ALIGNKIT_ASSERT(threw);
}

static void UnitTest() {
  UnitTestStereo8K();
  UnitTestMono22K();
  UnitTestStreamed();
  UnitTestTruncated();
  UnitTestRifxWithJunk();
  UnitTestExtractRange();
  UnitTestWriteRead();
  UnitTestWriteClips();
  UnitTestZeroSampleRate();
  UnitTestNotWave();
}

int main() {
  try {
    UnitTest();
    std::cout << "LGTM\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << e.what();
    return 1;
  }
}
