// align/utterance-metadata-test.cc

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

#include <unistd.h>

#include "align/utterance-metadata.h"
#include "util/alignkit-io.h"

namespace alignkit {

static void WriteTextFile(const std::string &filename,
                          const std::string &contents) {
  Output ko(filename, false);
  ko.Stream() << contents;
}

void UnitTestParseMetadataLine() {
  MetadataEntry entry;
  ALIGNKIT_ASSERT(ParseMetadataLine("u1|hello world", false, &entry));
  ALIGNKIT_ASSERT(entry.utt_id == "u1" && entry.text == "hello world" &&
                  !entry.has_speaker);
  ALIGNKIT_ASSERT(ParseMetadataLine("u2|spk|Hi there.", true, &entry));
  ALIGNKIT_ASSERT(entry.utt_id == "u2" && entry.speaker == "spk" &&
                  entry.text == "Hi there." && entry.has_speaker);
  // Empty text is allowed; the field must still be there.
  ALIGNKIT_ASSERT(ParseMetadataLine("u3|", false, &entry));
  ALIGNKIT_ASSERT(entry.text.empty());

  ALIGNKIT_ASSERT(!ParseMetadataLine("u1", false, &entry));
  ALIGNKIT_ASSERT(!ParseMetadataLine("u1|spk|text", false, &entry));
  ALIGNKIT_ASSERT(!ParseMetadataLine("u1|text", true, &entry));
  ALIGNKIT_ASSERT(!ParseMetadataLine("|text", false, &entry));
  ALIGNKIT_ASSERT(!ParseMetadataLine("u 1|text", false, &entry));

  MetadataEntry out;
  out.utt_id = "u9";
  out.text = "some text";
  std::ostringstream os;
  WriteMetadataLine(out, os);
  out.has_speaker = true;
  out.speaker = "s";
  WriteMetadataLine(out, os);
  ALIGNKIT_ASSERT(os.str() == "u9|some text\nu9|s|some text\n");
}

void UnitTestReadMetadata() {
  std::string filename = "tmp.utterance-metadata-test.csv";
  WriteTextFile(filename, "u1|a|hello world\n\nu2|b|second one\r\n");
  UtteranceMetadata metadata;
  metadata.Read(filename, true);
  ALIGNKIT_ASSERT(metadata.NumUtterances() == 2 && metadata.HasSpeaker());
  ALIGNKIT_ASSERT(metadata.Entries()[0].utt_id == "u1");
  const MetadataEntry *entry = metadata.Find("u2");
  ALIGNKIT_ASSERT(entry != NULL && entry->speaker == "b" &&
                  entry->text == "second one");
  ALIGNKIT_ASSERT(metadata.Find("u3") == NULL);

  // Reading without speakers sees three fields and dies.
  try {
    metadata.Read(filename, false);
    ALIGNKIT_ERR << "Expected failure.";
  } catch (const AlignkitFatalError &e) {
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("line 1") !=
                    std::string::npos);
  }

  WriteTextFile(filename, "u1|hello\nu2|there\nu1|again\n");
  try {
    metadata.Read(filename, false);
    ALIGNKIT_ERR << "Expected failure.";
  } catch (const AlignkitFatalError &e) {
    std::string msg = e.AlignkitMessage();
    ALIGNKIT_ASSERT(msg.find("Duplicate") != std::string::npos &&
                    msg.find("line 3") != std::string::npos);
  }

  UtteranceMetadata added;
  MetadataEntry e1;
  e1.utt_id = "x";
  added.Add(e1);
  bool threw = false;
  try {
    added.Add(e1);
  } catch (const AlignkitFatalError &e) {
    threw = true;
  }
  ALIGNKIT_ASSERT(threw);
  ALIGNKIT_ASSERT(added.NumUtterances() == 1);
  unlink(filename.c_str());
}

void UnitTestAudioFileIndex() {
  std::string dir = "tmp.utterance-metadata-test.dir";
  if (!DirectoryExists(dir))
    MakeDirectory(dir);
  std::string fallback_wav = JoinPath(dir, "u3.wav");
  WriteTextFile(fallback_wav, "");

  std::string list = "tmp.utterance-metadata-test.list";
  WriteTextFile(list, "/data/wavs/u1.wav\n  u2.flac \n\n");
  AudioFileIndex index;
  index.Read(list);
  ALIGNKIT_ASSERT(index.NumFiles() == 2);
  std::string path;
  ALIGNKIT_ASSERT(index.Find("u1", &path) && path == "/data/wavs/u1.wav");
  ALIGNKIT_ASSERT(index.Find("u2", &path) && path == "u2.flac");
  ALIGNKIT_ASSERT(!index.Find("u3", &path));
  index.SetFallbackDir(dir);
  ALIGNKIT_ASSERT(index.Find("u3", &path) && path == fallback_wav);
  ALIGNKIT_ASSERT(!index.Find("u4", &path));

  WriteTextFile(list, "a/u1.wav\nb/u1.wav\n");
  try {
    index.Read(list);
    ALIGNKIT_ERR << "Expected failure.";
  } catch (const AlignkitFatalError &e) {
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("line 2") !=
                    std::string::npos);
  }
  unlink(list.c_str());
  unlink(fallback_wav.c_str());
  rmdir(dir.c_str());
}

// Transcripts must be UTF-8; Latin-1 text or ids are rejected at read time
// with the line number.
void UnitTestReadMetadataEncoding() {
  std::string filename = "tmp.utterance-metadata-test.enc.csv";
  WriteTextFile(filename, "u1|caf\xc3\xa9 au lait\n");
  UtteranceMetadata metadata;
  metadata.Read(filename, false);
  ALIGNKIT_ASSERT(metadata.Find("u1")->text == "caf\xc3\xa9 au lait");

  const char *bad_files[] = { "u1|fine\nu2|h\xe9llo world\n",
                              "u1|fine\nu\xe9" "2|hello world\n" };
  for (int32 i = 0; i < 2; i++) {
    WriteTextFile(filename, bad_files[i]);
    bool threw = false;
    try {
      metadata.Read(filename, false);
    } catch (const AlignkitFatalError &e) {
      threw = true;
      std::string msg = e.AlignkitMessage();
      ALIGNKIT_ASSERT(msg.find("UTF-8") != std::string::npos &&
                      msg.find("Line 2") != std::string::npos &&
                      msg.find(filename) != std::string::npos);
    }
    ALIGNKIT_ASSERT(threw);
  }
  unlink(filename.c_str());
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestParseMetadataLine();
  UnitTestReadMetadata();
  UnitTestReadMetadataEncoding();
  UnitTestAudioFileIndex();
  std::cout << "Test OK.\n";
  return 0;
}
