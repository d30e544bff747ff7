#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/analysis/lexicon_sentiment_detector.hpp"
#include "internal/analysis/object_text_detector.hpp"
#include "internal/model/document_ref.hpp"
#include "internal/model/stage_payload.hpp"
#include "internal/pipeline/pipeline_definition.hpp"
#include "internal/stage/analysis_stage.hpp"
#include "internal/stage/metadata_stage.hpp"
#include "internal/stage/persistence_stage.hpp"
#include "internal/stage/stage_registry.hpp"
#include "internal/stage/text_extraction_stage.hpp"
#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/utf8.hpp"

namespace {

using docflow::model::GetString;
using docflow::model::StagePayload;
using docflow::stage::StageContext;
using docflow::stage::StageOutcome;

StageContext MakeContext(const std::string& container, const std::string& key) {
  StageContext context;
  context.document     = docflow::model::MakeDocumentRef(container, key);
  context.execution_id = "exec-test";
  return context;
}

const StagePayload& Child(const StagePayload& payload, const std::string& key) {
  return payload.fields().at(key).struct_value();
}

class RecordingSentimentDetector final : public docflow::analysis::SentimentDetector {
 public:
  docflow::analysis::SentimentResult DetectSentiment(const std::string& text, const std::string& language_code) override {
    last_text     = text;
    last_language = language_code;
    return {docflow::analysis::kNeutral, {{"Positive", 0.0}, {"Negative", 0.0}, {"Neutral", 1.0}, {"Mixed", 0.0}}};
  }

  std::string last_text;
  std::string last_language;
};

class ThrowingTextDetector final : public docflow::analysis::TextDetector {
 public:
  explicit ThrowingTextDetector(bool transient) : transient_(transient) {
  }

  std::vector<std::string> DetectText(const docflow::v1::DocumentRef&) override {
    if (transient_) throw docflow::util::TransientError("ocr throttled");
    throw docflow::util::MalformedDocument("unreadable scan");
  }

 private:
  bool transient_;
};

void TestMetadataUsesLastPathSegment() {
  docflow::stage::MetadataStage stage;
  assert(stage.Name() == "ExtractMetadata");

  auto result = stage.Execute({}, MakeContext("docs", "inbox/2024/a.pdf"));
  assert(result.outcome == StageOutcome::Success);
  assert(GetString(Child(result.payload, "metadata"), "title") == "a.pdf");
  assert(GetString(Child(result.payload, "metadata"), "source") == "docs");

  auto flat = stage.Execute({}, MakeContext("docs", "a.pdf"));
  assert(GetString(Child(flat.payload, "metadata"), "title") == "a.pdf");

  auto folder = stage.Execute({}, MakeContext("docs", "inbox/"));
  assert(folder.outcome == StageOutcome::Fatal);
}

void TestTextExtractionJoinsLines() {
  auto store = std::make_shared<docflow::storage::MemoryObjectStore>();
  store->Write("docs", "a.pdf", "Hello\r\n\n  \nworld\n", "text/plain");

  docflow::stage::TextExtractionStage stage(std::make_shared<docflow::analysis::ObjectTextDetector>(store));
  auto                                result = stage.Execute({}, MakeContext("docs", "a.pdf"));

  assert(result.outcome == StageOutcome::Success);
  assert(GetString(result.payload, "text") == "Hello\nworld");
}

void TestTextExtractionClassifiesFailures() {
  auto store = std::make_shared<docflow::storage::MemoryObjectStore>();
  store->Write("docs", "binary.pdf", std::string("\xff\xfe\x00\x01", 4), "application/pdf");

  docflow::stage::TextExtractionStage from_store(std::make_shared<docflow::analysis::ObjectTextDetector>(store));
  assert(from_store.Execute({}, MakeContext("docs", "binary.pdf")).outcome == StageOutcome::Fatal);
  assert(from_store.Execute({}, MakeContext("docs", "missing.pdf")).outcome == StageOutcome::Fatal);

  docflow::stage::TextExtractionStage transient(std::make_shared<ThrowingTextDetector>(true));
  auto                                retry = transient.Execute({}, MakeContext("docs", "a.pdf"));
  assert(retry.outcome == StageOutcome::Retryable);
  assert(retry.reason == "ocr throttled");

  docflow::stage::TextExtractionStage malformed(std::make_shared<ThrowingTextDetector>(false));
  assert(malformed.Execute({}, MakeContext("docs", "a.pdf")).outcome == StageOutcome::Fatal);
}

void TestAnalysisTruncatesLongText() {
  auto                          detector = std::make_shared<RecordingSentimentDetector>();
  docflow::stage::AnalysisStage stage(detector);

  StagePayload payload;
  (*payload.mutable_fields())["text"].set_string_value(std::string(6000, 'x'));

  auto result = stage.Execute(payload, MakeContext("docs", "long.txt"));
  assert(result.outcome == StageOutcome::Success);
  assert(detector->last_text.size() == 5000);
  assert(detector->last_language == "en");
  assert(GetString(Child(result.payload, "analysis"), "sentiment") == "NEUTRAL");
  assert(Child(Child(result.payload, "analysis"), "scores").fields().at("Neutral").number_value() == 1.0);
}

void TestAnalysisCountsCodePoints() {
  auto                          detector = std::make_shared<RecordingSentimentDetector>();
  docflow::stage::AnalysisStage stage(detector, 3);

  StagePayload payload;
  (*payload.mutable_fields())["text"].set_string_value("\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9");  // "éééé"

  assert(stage.Execute(payload, MakeContext("docs", "a.txt")).outcome == StageOutcome::Success);
  assert(detector->last_text == "\xc3\xa9\xc3\xa9\xc3\xa9");

  assert(docflow::util::CodePointCount("h\xc3\xa9llo") == 5);
  assert(docflow::util::TruncateCodePoints("h\xc3\xa9llo", 2) == "h\xc3\xa9");
  assert(docflow::util::IsValidUtf8("h\xc3\xa9llo"));
  assert(!docflow::util::IsValidUtf8("\xc0\xaf"));
  assert(!docflow::util::IsValidUtf8("\xed\xa0\x80"));
}

void TestAnalysisWithoutTextIsFatal() {
  docflow::stage::AnalysisStage stage(std::make_shared<RecordingSentimentDetector>());
  assert(stage.Execute({}, MakeContext("docs", "a.pdf")).outcome == StageOutcome::Fatal);
}

void TestLexiconDetector() {
  auto detector = docflow::analysis::LexiconSentimentDetector::Create();

  auto hello = detector->DetectSentiment("Hello world", "en");
  assert(hello.label == "POSITIVE");
  assert(hello.scores.size() == 4);

  assert(detector->DetectSentiment("This is a terrible, broken product", "en").label == "NEGATIVE");
  assert(detector->DetectSentiment("The meeting is on Tuesday", "en").label == "NEUTRAL");
  assert(detector->DetectSentiment("Great food but awful service", "en").label == "MIXED");

  double total = 0;
  for (const auto& [_, score] : hello.scores) total += score;
  assert(total > 0.999 && total < 1.001);

  bool unsupported = false;
  try {
    detector->DetectSentiment("Hola mundo", "es");
  } catch (const docflow::util::Unsupported&) {
    unsupported = true;
  }
  assert(unsupported);

  // The stage maps an unsupported language to a fatal failure.
  docflow::stage::AnalysisStage stage(detector, 5000, "es");
  StagePayload                  payload;
  (*payload.mutable_fields())["text"].set_string_value("Hola");
  assert(stage.Execute(payload, MakeContext("docs", "a.txt")).outcome == StageOutcome::Fatal);
}

void TestPersistenceWritesResultDocument() {
  auto                             store = std::make_shared<docflow::storage::MemoryObjectStore>();
  docflow::stage::PersistenceStage stage(store);

  StagePayload payload = docflow::model::SeedPayload(docflow::model::MakeDocumentRef("docs", "a.pdf"));
  (*payload.mutable_fields())["text"].set_string_value("Hello world");

  auto result = stage.Execute(payload, MakeContext("docs", "a.pdf"));
  assert(result.outcome == StageOutcome::Success);
  assert(GetString(result.payload, "result_path") == "docs/results/a.pdf.json");

  assert(store->Exists("docs", "results/a.pdf.json"));
  assert(store->ContentType("docs", "results/a.pdf.json") == "application/json");

  const auto written = docflow::model::FromJson(store->Read("docs", "results/a.pdf.json"));
  assert(GetString(written, "text") == "Hello world");
  assert(GetString(written, "result_path") == "docs/results/a.pdf.json");
  assert(store->Read("docs", "results/a.pdf.json").find('\n') != std::string::npos);
}

void TestPersistenceHonoursCancelledAttempt() {
  auto                             store = std::make_shared<docflow::storage::MemoryObjectStore>();
  docflow::stage::PersistenceStage stage(store);

  auto run     = std::make_shared<docflow::runtime::CancellationToken>();
  auto attempt = std::make_shared<docflow::runtime::CancellationToken>(run);

  auto context   = MakeContext("docs", "a.pdf");
  context.cancel = attempt;

  attempt->Cancel();
  auto abandoned = stage.Execute(docflow::model::SeedPayload(context.document), context);
  assert(abandoned.outcome == StageOutcome::Retryable);
  assert(!store->Exists("docs", "results/a.pdf.json"));
  assert(!attempt->Published());

  // A cancelled run fences every attempt made for it.
  auto next      = std::make_shared<docflow::runtime::CancellationToken>(run);
  context.cancel = next;
  run->Cancel();
  assert(stage.Execute(docflow::model::SeedPayload(context.document), context).outcome == StageOutcome::Retryable);
  assert(!store->Exists("docs", "results/a.pdf.json"));

  auto live      = std::make_shared<docflow::runtime::CancellationToken>();
  context.cancel = live;
  assert(stage.Execute(docflow::model::SeedPayload(context.document), context).outcome == StageOutcome::Success);
  assert(store->Exists("docs", "results/a.pdf.json"));
  assert(live->Published());

  live->Cancel();
  assert(live->Published());
}

void TestRegistryValidation() {
  docflow::stage::StageRegistry registry;
  registry.Register(std::make_shared<docflow::stage::MetadataStage>());

  bool duplicate = false;
  try {
    registry.Register(std::make_shared<docflow::stage::MetadataStage>());
  } catch (const docflow::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  bool missing = false;
  try {
    registry.Validate(docflow::pipeline::PipelineDefinition::Default());
  } catch (const docflow::util::InvalidArgument& e) {
    missing = std::string(e.what()).find("ExtractText, AnalyzeText, StoreResults") != std::string::npos;
  }
  assert(missing);
  assert(registry.Find("ExtractText") == nullptr);
}

void TestClassifyFailure() {
  using docflow::stage::ClassifyFailure;

  assert(ClassifyFailure(docflow::util::TransientError("x")).outcome == StageOutcome::Retryable);
  assert(ClassifyFailure(docflow::util::StoreUnavailable("x")).outcome == StageOutcome::Retryable);
  assert(ClassifyFailure(std::runtime_error("x")).outcome == StageOutcome::Retryable);
  assert(ClassifyFailure(docflow::util::MalformedDocument("x")).outcome == StageOutcome::Fatal);
  assert(ClassifyFailure(docflow::util::Unsupported("x")).outcome == StageOutcome::Fatal);
}

} // namespace

int main() {
  TestMetadataUsesLastPathSegment();
  TestTextExtractionJoinsLines();
  TestTextExtractionClassifiesFailures();
  TestAnalysisTruncatesLongText();
  TestAnalysisCountsCodePoints();
  TestAnalysisWithoutTextIsFatal();
  TestLexiconDetector();
  TestPersistenceWritesResultDocument();
  TestPersistenceHonoursCancelledAttempt();
  TestRegistryValidation();
  TestClassifyFailure();

  std::cout << "docflow_unit_stages: pass\n";
  return 0;
}
