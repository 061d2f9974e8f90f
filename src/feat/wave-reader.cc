// feat/wave-reader.cc

// Copyright 2009-2011  Karel Vesely;  Petr Motlicek
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

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "feat/wave-reader.h"
#include "util/alignkit-io.h"

namespace alignkit {

namespace {

// Reads the fields of a RIFF header, in either byte order, and counts the
// bytes consumed so the chunk sizes can be checked.
class RiffReader {
 public:
  explicit RiffReader(std::istream &is): is_(is), big_endian_(false),
                                         num_read_(0) { }

  void SetBigEndian(bool big_endian) { big_endian_ = big_endian; }

  std::string ReadTag() {
    unsigned char buf[4];
    ReadBytes(buf, 4);
    return std::string(reinterpret_cast<char*>(buf), 4);
  }

  void ExpectTag(const char *expected) {
    std::string tag = ReadTag();
    if (tag != expected)
      ALIGNKIT_ERR << "expected \"" << expected << "\" chunk, got \"" << tag
                   << "\"";
  }

  uint32 ReadUint32() {
    unsigned char b[4];
    ReadBytes(b, 4);
    if (big_endian_)
      std::reverse(b, b + 4);
    return static_cast<uint32>(b[0]) | static_cast<uint32>(b[1]) << 8 |
        static_cast<uint32>(b[2]) << 16 | static_cast<uint32>(b[3]) << 24;
  }

  uint16 ReadUint16() {
    unsigned char b[2];
    ReadBytes(b, 2);
    if (big_endian_)
      std::swap(b[0], b[1]);
    return static_cast<uint16>(b[0] | b[1] << 8);
  }

  void Skip(uint32 num_bytes) {
    is_.ignore(num_bytes);
    if (is_.gcount() != static_cast<std::streamsize>(num_bytes))
      ALIGNKIT_ERR << "unexpected end of file inside a header chunk";
    num_read_ += num_bytes;
  }

  int64 NumRead() const { return num_read_; }

 private:
  void ReadBytes(unsigned char *buf, int32 n) {
    is_.read(reinterpret_cast<char*>(buf), n);
    if (is_.fail())
      ALIGNKIT_ERR << "unexpected end of file or read error in wave header";
    num_read_ += n;
  }

  std::istream &is_;
  bool big_endian_;
  int64 num_read_;
};

// What the header says about the samples that follow it.
struct WaveFormat {
  BaseFloat samp_freq;
  int32 num_channels;
  bool big_endian;
  int64 data_bytes;  // -1 if the data runs to end of file.
};

// GUID of KSDATAFORMAT_SUBTYPE_PCM, read as four 32-bit words.
const uint32 kPcmSubtype[4] = { 0x00000001, 0x00100000,
                                0xAA000080, 0x719B3800 };

const uint16 kFormatPcm = 1, kFormatExtensible = 0xFFFE;

// Reads the "fmt " chunk body, whose size field has already been read.
void ReadFormatChunk(RiffReader *reader, uint32 chunk_size,
                     WaveFormat *format) {
  if (chunk_size < 16)
    ALIGNKIT_ERR << "fmt chunk too short (" << chunk_size << " bytes)";
  uint16 format_tag = reader->ReadUint16(),
      num_channels = reader->ReadUint16();
  uint32 sample_rate = reader->ReadUint32(),
      byte_rate = reader->ReadUint32();
  uint16 block_align = reader->ReadUint16(),
      bits_per_sample = reader->ReadUint16();
  uint32 consumed = 16;

  if (format_tag == kFormatExtensible) {
    uint16 extra_size = reader->ReadUint16();
    if (chunk_size < 40 || extra_size < 22)
      ALIGNKIT_ERR << "malformed WAVE_FORMAT_EXTENSIBLE header";
    reader->ReadUint16();  // valid bits per sample
    reader->ReadUint32();  // speaker position mask
    for (int32 i = 0; i < 4; i++)
      if (reader->ReadUint32() != kPcmSubtype[i])
        ALIGNKIT_ERR << "WAVE_FORMAT_EXTENSIBLE subtype is not PCM";
    consumed = 40;
  } else if (format_tag != kFormatPcm) {
    ALIGNKIT_ERR << "only PCM data is supported, format tag is "
                 << format_tag;
  }
  reader->Skip(chunk_size - consumed);

  if (num_channels == 0)
    ALIGNKIT_ERR << "header gives zero channels";
  if (sample_rate == 0)
    ALIGNKIT_ERR << "header gives a sample rate of 0 Hz";
  if (bits_per_sample != 16)
    ALIGNKIT_ERR << "only 16-bit samples are supported, got "
                 << bits_per_sample;
  if (block_align != num_channels * 2)
    ALIGNKIT_ERR << "block align " << block_align << " does not match "
                 << num_channels << " channels of 16-bit samples";
  if (byte_rate != sample_rate * block_align)
    ALIGNKIT_ERR << "byte rate " << byte_rate << " does not match "
                 << sample_rate << " Hz * " << block_align << " bytes";
  format->samp_freq = static_cast<BaseFloat>(sample_rate);
  format->num_channels = num_channels;
}

// Reads everything up to the start of the sample data.
void ReadWaveHeader(std::istream &is, WaveFormat *format) {
  RiffReader reader(is);
  std::string riff = reader.ReadTag();
  if (riff == "RIFF")
    format->big_endian = false;
  else if (riff == "RIFX")
    format->big_endian = true;
  else
    ALIGNKIT_ERR << "not a wave file: expected RIFF or RIFX, got \""
                 << riff << "\"";
  reader.SetBigEndian(format->big_endian);
  uint32 riff_size = reader.ReadUint32();
  int64 riff_start = reader.NumRead();
  reader.ExpectTag("WAVE");

  // Some writers put a JUNK or similar chunk before "fmt ".
  std::string tag = reader.ReadTag();
  while (tag != "fmt ") {
    reader.Skip(reader.ReadUint32());
    tag = reader.ReadTag();
  }
  ReadFormatChunk(&reader, reader.ReadUint32(), format);

  for (tag = reader.ReadTag(); tag != "data"; tag = reader.ReadTag()) {
    uint32 size = reader.ReadUint32();
    if (tag == "fact" && size != 4)
      ALIGNKIT_WARN << "fact chunk has " << size << " bytes, expected 4";
    reader.Skip(size);
  }
  uint32 data_size = reader.ReadUint32();

  // Size values seen from streaming writers; 0x7FFFF000 is what SoX uses.
  bool streamed = riff_size == 0 || riff_size == 0xFFFFFFFF ||
      data_size == 0 || data_size == 0xFFFFFFFF || data_size == 0x7FFFF000;
  if (streamed) {
    ALIGNKIT_VLOG(1) << "RIFF size " << riff_size << ", data size "
                     << data_size << ": reading samples to end of file.";
    format->data_bytes = -1;
    return;
  }
  // A RIFF chunk may be padded by one byte to an even size.
  int64 expected = reader.NumRead() - riff_start + data_size;
  if (std::abs(expected - static_cast<int64>(riff_size)) > 1)
    ALIGNKIT_WARN << "RIFF chunk size is " << riff_size << " but the first "
                  << "data chunk ends at " << expected
                  << "; further data chunks are ignored.";
  format->data_bytes = data_size;
}

void AppendUint32(uint32 i, std::string *buf) {
  for (int32 b = 0; b < 4; b++)
    buf->push_back(static_cast<char>((i >> (8 * b)) & 0xFF));
}

void AppendUint16(uint16 i, std::string *buf) {
  buf->push_back(static_cast<char>(i & 0xFF));
  buf->push_back(static_cast<char>(i >> 8));
}

}  // namespace

void WaveData::Read(std::istream &is) {
  WaveFormat format;
  ReadWaveHeader(is, &format);

  std::vector<char> bytes;
  const int64 kBlockSize = 1 << 20;
  while (is && (format.data_bytes < 0 ||
                static_cast<int64>(bytes.size()) < format.data_bytes)) {
    int64 want = kBlockSize;
    if (format.data_bytes >= 0)
      want = std::min(want, format.data_bytes -
                      static_cast<int64>(bytes.size()));
    size_t offset = bytes.size();
    bytes.resize(offset + want);
    is.read(&bytes[offset], want);
    bytes.resize(offset + is.gcount());
  }
  if (is.bad())
    ALIGNKIT_ERR << "read error in wave data";
  if (bytes.empty())
    ALIGNKIT_ERR << "wave file has no sample data";
  if (format.data_bytes >= 0 &&
      static_cast<int64>(bytes.size()) < format.data_bytes)
    ALIGNKIT_WARN << "wave data truncated: header says " << format.data_bytes
                  << " bytes, read " << bytes.size();

  int32 num_chan = format.num_channels;
  size_t num_samp = bytes.size() / (2 * num_chan);
  int32 lo = (format.big_endian ? 1 : 0), hi = 1 - lo;
  samp_freq_ = format.samp_freq;
  data_.assign(num_chan, std::vector<BaseFloat>(num_samp));
  const unsigned char *p = reinterpret_cast<const unsigned char*>(bytes.data());
  for (size_t i = 0; i < num_samp; i++) {
    for (int32 c = 0; c < num_chan; c++, p += 2)
      data_[c][i] = static_cast<int16>(static_cast<uint16>(p[lo] | p[hi] << 8));
  }
}

void WaveData::Write(std::ostream &os) const {
  if (data_.empty())
    ALIGNKIT_ERR << "cannot write a wave file with no channels";
  ALIGNKIT_ASSERT(samp_freq_ > 0);
  uint16 num_chan = NumChannels(), block_align = 2 * num_chan;
  uint32 num_samp = NumSamples(),
      rate = static_cast<uint32>(samp_freq_),
      data_bytes = num_samp * block_align;

  std::string buf;
  buf.reserve(44 + data_bytes);
  buf += "RIFF";
  AppendUint32(36 + data_bytes, &buf);
  buf += "WAVEfmt ";
  AppendUint32(16, &buf);
  AppendUint16(kFormatPcm, &buf);
  AppendUint16(num_chan, &buf);
  AppendUint32(rate, &buf);
  AppendUint32(rate * block_align, &buf);
  AppendUint16(block_align, &buf);
  AppendUint16(16, &buf);
  buf += "data";
  AppendUint32(data_bytes, &buf);

  const BaseFloat kMin = std::numeric_limits<int16>::min(),
      kMax = std::numeric_limits<int16>::max();
  int64 num_clipped = 0;
  for (uint32 i = 0; i < num_samp; i++) {
    for (uint16 c = 0; c < num_chan; c++) {
      BaseFloat v = std::trunc(data_[c][i]);
      if (v < kMin || v > kMax) {
        v = (v < kMin ? kMin : kMax);
        num_clipped++;
      }
      AppendUint16(static_cast<uint16>(static_cast<int16>(v)), &buf);
    }
  }
  os.write(buf.data(), buf.size());
  if (os.fail())
    ALIGNKIT_ERR << "error writing wave data";
  if (num_clipped > 0)
    ALIGNKIT_WARN << "Clipped " << num_clipped << " of "
                  << static_cast<int64>(num_samp) * num_chan << " samples.";
}

void WaveData::ExtractRange(int64 begin, int64 end, WaveData *out) const {
  ALIGNKIT_ASSERT(begin >= 0 && begin <= end && end <= NumSamples());
  std::vector<std::vector<BaseFloat> > range(data_.size());
  for (size_t c = 0; c < data_.size(); c++)
    range[c].assign(data_[c].begin() + begin, data_[c].begin() + end);
  out->data_.swap(range);
  out->samp_freq_ = samp_freq_;
}

void ReadWaveFile(const std::string &filename, WaveData *wave) {
  Input ki(filename, true);
  try {
    wave->Read(ki.Stream());
  } catch (const AlignkitFatalError &e) {
    ALIGNKIT_ERR << "Error reading wave file " << PrintableRxfilename(filename)
                 << ": " << e.AlignkitMessage();
  }
}

void WriteWaveFile(const std::string &filename, const WaveData &wave) {
  Output ko(filename, true);
  wave.Write(ko.Stream());
  if (!ko.Close())
    ALIGNKIT_ERR << "Error writing wave file " << PrintableWxfilename(filename);
}

}  // namespace alignkit
