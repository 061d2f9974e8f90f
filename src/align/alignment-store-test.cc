// align/alignment-store-test.cc

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
#include <thread>

#include "align/alignment-store.h"

namespace alignkit {

static void WriteTextFile(const std::string &filename,
                          const std::string &contents) {
  Output ko(filename, false);
  ko.Stream() << contents;
}

static AlignmentRecord MakeRecord(const std::string &utt_id, bool aligned,
                                  bool with_speaker) {
  AlignmentRecord record;
  record.utt_id = utt_id;
  if (with_speaker) record.SetSpeaker("spk_" + utt_id);
  if (aligned) {
    WordSpan hello("hello", 0.12, 0.48);
    hello.phones.push_back(PhoneSpan("HH", 0.12, 0.2));
    hello.phones.push_back(PhoneSpan("AH0", 0.2, 0.3));
    hello.phones.push_back(PhoneSpan("L", 0.3, 0.38));
    hello.phones.push_back(PhoneSpan("OW1", 0.38, 0.48));
    record.words.push_back(hello);
    record.words.push_back(WordSpan("world", 0.5, 0.91));
  }
  return record;
}

void UnitTestJsonRoundTrip() {
  for (int32 i = 0; i < 4; i++) {
    bool aligned = (i % 2 == 0), with_speaker = (i / 2 == 0);
    AlignmentRecord record = MakeRecord("utt" + std::to_string(i), aligned,
                                        with_speaker);
    std::string line = AlignmentRecordToJson(record);
    ALIGNKIT_ASSERT(line.find('\n') == std::string::npos);
    AlignmentRecord record2;
    std::string why;
    ALIGNKIT_ASSERT(AlignmentRecordFromJson(line, &record2, &why));
    ALIGNKIT_ASSERT(record2 == record);
    ALIGNKIT_ASSERT(record2.has_speaker == with_speaker);
  }
  // An unaligned record without speaker has an explicit null speaker and an
  // empty word list.
  std::string line = AlignmentRecordToJson(MakeRecord("u0", false, false));
  ALIGNKIT_ASSERT(line.find("\"speaker\":null") != std::string::npos);
  ALIGNKIT_ASSERT(line.find("\"words\":[]") != std::string::npos);
  // Words without phones do not get a phones key.
  line = AlignmentRecordToJson(MakeRecord("u0", true, false));
  ALIGNKIT_ASSERT(line.find("\"phones\"") != std::string::npos);
  AlignmentRecord no_phones;
  no_phones.utt_id = "u1";
  no_phones.words.push_back(WordSpan("a", 0.0, 1.0));
  ALIGNKIT_ASSERT(AlignmentRecordToJson(no_phones).find("phones") ==
                  std::string::npos);
}

void UnitTestJsonSchemaErrors() {
  const char *bad_lines[] = {
    "",
    "{",
    "[]",
    "{\"speaker\":null,\"words\":[]}",
    "{\"id\":7,\"speaker\":null,\"words\":[]}",
    "{\"id\":\"a b\",\"speaker\":null,\"words\":[]}",
    "{\"id\":\"u1\",\"words\":[]}",
    "{\"id\":\"u1\",\"speaker\":3,\"words\":[]}",
    "{\"id\":\"u1\",\"speaker\":null}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":{}}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":[{\"text\":\"a\",\"start\":0}]}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":[{\"text\":\"a\",\"start\":\"0\","
    "\"end\":1}]}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":[{\"text\":\"a\",\"start\":0.5,"
    "\"end\":0.2}]}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":[{\"text\":\"a\",\"start\":0,"
    "\"end\":1},{\"text\":\"b\",\"start\":0.5,\"end\":2}]}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":[{\"text\":\"a\",\"start\":0,"
    "\"end\":1,\"phones\":[{\"phone\":\"x\",\"start\":0}]}]}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":[{\"text\":\"a\",\"start\":0,"
    "\"end\":1,\"phones\":[{\"phone\":\"a b\",\"start\":0,\"end\":1}]}]}",
    "{\"id\":\"u1\",\"speaker\":null,\"words\":[{\"text\":\"a\",\"start\":0,"
    "\"end\":1,\"phones\":[{\"phone\":\"\",\"start\":0,\"end\":1}]}]}",
  };
  for (size_t i = 0; i < sizeof(bad_lines) / sizeof(bad_lines[0]); i++) {
    AlignmentRecord record;
    std::string why;
    ALIGNKIT_ASSERT(!AlignmentRecordFromJson(bad_lines[i], &record, &why));
    ALIGNKIT_ASSERT(!why.empty());
    ALIGNKIT_LOG << "Expected failure: " << why;
  }
  // Extra keys are ignored.
  AlignmentRecord record;
  std::string why;
  ALIGNKIT_ASSERT(AlignmentRecordFromJson(
      "{\"id\":\"u1\",\"speaker\":\"s\",\"words\":[],\"extra\":1}",
      &record, &why));
  ALIGNKIT_ASSERT(record.has_speaker && record.speaker == "s");
}

// Text that is not UTF-8 cannot go into JSON; it is a fatal error that names
// the utterance, and nothing is written.
void UnitTestNonUtf8Record() {
  AlignmentRecord record;
  record.utt_id = "latin1";
  record.words.push_back(WordSpan("h\xe9llo", 0.0, 0.5));
  bool threw = false;
  try {
    AlignmentRecordToJson(record);
  } catch (const AlignkitFatalError &e) {
    threw = true;
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("latin1") !=
                    std::string::npos);
  }
  ALIGNKIT_ASSERT(threw);

  std::string filename = "tmp.alignment-store-test.utf8.jsonl";
  {
    AlignmentWriter writer(filename);
    writer.Write(MakeRecord("u1", true, false));
    threw = false;
    try {
      writer.Write(record);
    } catch (const AlignkitFatalError &e) {
      threw = true;
    }
    ALIGNKIT_ASSERT(threw);
    ALIGNKIT_ASSERT(writer.Close());
    ALIGNKIT_ASSERT(!writer.WriteJsonLine("{}"));  // closed.
  }
  int32 num_records = 0;
  for (SequentialAlignmentReader reader(filename); !reader.Done();
       reader.Next())
    num_records++;
  ALIGNKIT_ASSERT(num_records == 1);
  unlink(filename.c_str());
}

void UnitTestWriteAndRead() {
  std::string filename = "tmp.alignment-store-test.jsonl";
  std::vector<AlignmentRecord> records;
  records.push_back(MakeRecord("u1", true, true));
  records.push_back(MakeRecord("u2", false, true));
  records.push_back(MakeRecord("u3", true, false));
  {
    AlignmentWriter writer(filename);
    for (size_t i = 0; i < records.size(); i++)
      writer.Write(records[i]);
    ALIGNKIT_ASSERT(writer.Close());
  }
  SequentialAlignmentReader reader(filename);
  size_t i = 0;
  for (; !reader.Done(); reader.Next(), i++) {
    ALIGNKIT_ASSERT(i < records.size());
    ALIGNKIT_ASSERT(reader.Key() == records[i].utt_id);
    ALIGNKIT_ASSERT(reader.Value() == records[i]);
    ALIGNKIT_ASSERT(reader.LineNumber() == static_cast<int32>(i + 1));
  }
  ALIGNKIT_ASSERT(i == records.size());
  reader.Close();
  unlink(filename.c_str());
}

void UnitTestConcurrentWriter() {
  std::string filename = "tmp.alignment-store-test.concurrent.jsonl";
  const int32 num_threads = 4, num_per_thread = 50;
  {
    AlignmentWriter writer(filename);
    std::vector<std::thread> threads;
    for (int32 t = 0; t < num_threads; t++) {
      threads.push_back(std::thread([&writer, t, num_per_thread]() {
        for (int32 n = 0; n < num_per_thread; n++) {
          std::string id = "t" + std::to_string(t) + "_" + std::to_string(n);
          writer.Write(MakeRecord(id, n % 3 != 0, n % 2 == 0));
        }
      }));
    }
    for (size_t t = 0; t < threads.size(); t++)
      threads[t].join();
  }
  // Every line must be a whole record.
  int32 num_read = 0;
  for (SequentialAlignmentReader reader(filename); !reader.Done();
       reader.Next())
    num_read++;
  ALIGNKIT_ASSERT(num_read == num_threads * num_per_thread);
  unlink(filename.c_str());
}

void UnitTestBlankLines() {
  std::string filename = "tmp.alignment-store-test.blank.jsonl";
  WriteTextFile(filename, "\n" + AlignmentRecordToJson(MakeRecord("u1", true,
                                                                  false)) +
                "\n   \n" + AlignmentRecordToJson(MakeRecord("u2", false,
                                                             false)) + "\n\n");
  SequentialAlignmentReader reader(filename);
  ALIGNKIT_ASSERT(!reader.Done() && reader.Key() == "u1" &&
                  reader.LineNumber() == 2);
  reader.Next();
  ALIGNKIT_ASSERT(!reader.Done() && reader.Key() == "u2" &&
                  reader.LineNumber() == 4);
  reader.Next();
  ALIGNKIT_ASSERT(reader.Done());
  unlink(filename.c_str());
}

void UnitTestMalformedLine() {
  std::string filename = "tmp.alignment-store-test.bad.jsonl";
  WriteTextFile(filename,
                AlignmentRecordToJson(MakeRecord("u1", true, false)) + "\n" +
                AlignmentRecordToJson(MakeRecord("u2", true, false)) + "\n" +
                "{\"id\":\"u3\",\"speaker\":null,\"words\":[{\"text\":\"a\"\n");
  SequentialAlignmentReader reader(filename);
  std::vector<std::string> keys;
  try {
    for (; !reader.Done(); reader.Next())
      keys.push_back(reader.Key());
    ALIGNKIT_ERR << "Expected failure on line 3.";
  } catch (const AlignkitFatalError &e) {
    std::string msg = e.AlignkitMessage();
    ALIGNKIT_ASSERT(msg.find("line 3") != std::string::npos);
    ALIGNKIT_ASSERT(msg.find(filename) != std::string::npos);
  }
  // The records before the bad line were delivered.
  ALIGNKIT_ASSERT(keys.size() == 2 && keys[0] == "u1" && keys[1] == "u2");
  unlink(filename.c_str());
}

void UnitTestDuplicateId() {
  std::string filename = "tmp.alignment-store-test.dup.jsonl";
  std::string line = AlignmentRecordToJson(MakeRecord("u1", true, false));
  WriteTextFile(filename, line + "\n" + line + "\n");
  SequentialAlignmentReader reader(filename);
  ALIGNKIT_ASSERT(reader.Key() == "u1");
  try {
    reader.Next();
    ALIGNKIT_ERR << "Expected failure on duplicate id.";
  } catch (const AlignkitFatalError &e) {
    std::string msg = e.AlignkitMessage();
    ALIGNKIT_ASSERT(msg.find("Duplicate") != std::string::npos);
    ALIGNKIT_ASSERT(msg.find("line 2") != std::string::npos);
  }
  unlink(filename.c_str());
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestJsonRoundTrip();
  UnitTestJsonSchemaErrors();
  UnitTestNonUtf8Record();
  UnitTestWriteAndRead();
  UnitTestConcurrentWriter();
  UnitTestBlankLines();
  UnitTestMalformedLine();
  UnitTestDuplicateId();
  std::cout << "Test OK.\n";
  return 0;
}
