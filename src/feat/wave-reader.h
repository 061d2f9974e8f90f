// feat/wave-reader.h

// Copyright 2009-2011  Karel Vesely;  Microsoft Corporation
//                2013  Florent Masson
//                2013  Johns Hopkins University (author: Daniel Povey)
//                2026  Alignkit Authors

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

#ifndef ALIGNKIT_FEAT_WAVE_READER_H_
#define ALIGNKIT_FEAT_WAVE_READER_H_

#include <string>
#include <utility>
#include <vector>

#include "base/alignkit-common.h"

// Reading and writing of RIFF WAVE files with 16-bit PCM samples, which is
// what the aligners and the TTS training recipes consume.  Both plain PCM
// and WAVE_FORMAT_EXTENSIBLE headers with the PCM subtype are read, as are
// "RIFX" (big-endian) files.  Unknown chunks before or after "fmt " (JUNK,
// LIST, fact, ...) are skipped, and only the first "data" chunk is read.
// A file whose RIFF or data size is 0 or 0xFFFFFFFF, as written by
// programs that stream to a pipe, is read to end of file.
//
// Samples are stored as BaseFloat with their integer values, i.e. in the
// range [-32768, 32767], not scaled to [-1, 1].

namespace alignkit {

/// Audio of one utterance, stored one row per channel: Data()[c][i] is
/// sample i of channel c.
class WaveData {
 public:
  WaveData(): samp_freq_(0.0) { }

  WaveData(BaseFloat samp_freq,
           const std::vector<std::vector<BaseFloat> > &data)
      : data_(data), samp_freq_(samp_freq) { }

  /// Reads a whole file from "is", which must be in binary mode, replacing
  /// the current contents.  Throws on error.
  void Read(std::istream &is);

  /// Writes a canonical 44-byte-header 16-bit PCM file.  Samples outside the
  /// int16 range are clipped with a warning.  Throws on error.
  void Write(std::ostream &os) const;

  const std::vector<std::vector<BaseFloat> > &Data() const { return data_; }

  BaseFloat SampFreq() const { return samp_freq_; }

  int32 NumChannels() const { return data_.size(); }

  /// Samples per channel.
  int64 NumSamples() const {
    return data_.empty() ? 0 : static_cast<int64>(data_[0].size());
  }

  /// In seconds; 0 if there is no sampling rate.
  double Duration() const {
    return samp_freq_ > 0 ? NumSamples() / static_cast<double>(samp_freq_)
        : 0.0;
  }

  /// Copies samples [begin, end) of every channel into *out, which gets
  /// the same sampling rate.  Requires 0 <= begin <= end <= NumSamples().
  void ExtractRange(int64 begin, int64 end, WaveData *out) const;

  void Clear() {
    data_.clear();
    samp_freq_ = 0.0;
  }

  void Swap(WaveData *other) {
    data_.swap(other->data_);
    std::swap(samp_freq_, other->samp_freq_);
  }

 private:
  std::vector<std::vector<BaseFloat> > data_;
  BaseFloat samp_freq_;
};

/// Reads a wave file; the error names the file.
void ReadWaveFile(const std::string &filename, WaveData *wave);

/// Writes a wave file; the error names the file.
void WriteWaveFile(const std::string &filename, const WaveData &wave);

}  // namespace alignkit

#endif  // ALIGNKIT_FEAT_WAVE_READER_H_
