#include "test_harness.h"

#include <stdexcept>
#include <string>
#include <vector>

#include "csvhue/highlight_driver.h"
#include "test_utils.h"

namespace {

/// Store that rejects annotations starting at one offset.
class RejectingStore : public csvhue::MemoryAnnotationStore {
 public:
  explicit RejectingStore(size_t reject_start) : reject_start_(reject_start) {}

  csvhue::AnnotationId create(size_t start,
                              size_t end,
                              const csvhue::Face& face,
                              const std::string& tag) override {
    if (start == reject_start_) {
      throw std::runtime_error("store rejected range");
    }
    return csvhue::MemoryAnnotationStore::create(start, end, face, tag);
  }

 private:
  size_t reject_start_;
};

void test_driver_colors_columns_in_order() {
  csvhue::Document doc("a,b,c,d");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  driver.apply_highlights(0, doc.size());
  auto all = store.all();
  expect_eq(all.size(), 4, "one annotation per field");
  if (all.size() == 4) {
    expect_str(all[0].face.color, "#ff0000", "column 0 color");
    expect_str(all[1].face.color, "#00ff00", "column 1 color");
    expect_str(all[2].face.color, "#0000ff", "column 2 color");
    expect_str(all[3].face.color, "#ff0000", "column 3 wraps to first color");
    expect_str(all[3].tag, csvhue::kAnnotationTag, "annotations carry driver tag");
    expect_true(all[2].start == 4 && all[2].end == 5, "annotation covers field range");
  }
}

void test_driver_idempotent() {
  csvhue::Document doc("x,\"y,z\",\nq");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  driver.apply_highlights(0, doc.size());
  auto first = store.all();
  driver.apply_highlights(0, doc.size());
  auto second = store.all();
  expect_eq(second.size(), first.size(), "repeat run keeps annotation count");
  for (size_t i = 0; i < first.size() && i < second.size(); ++i) {
    expect_true(first[i].start == second[i].start && first[i].end == second[i].end,
                "repeat run keeps ranges");
    expect_true(first[i].face == second[i].face, "repeat run keeps faces");
  }
}

void test_driver_region_isolation() {
  csvhue::Document doc("a,b\nc,d\ne,f");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  driver.apply_highlights(0, doc.size());
  auto line0 = annotation_ids(line_annotations(store, doc, 0));
  auto line1 = annotation_ids(line_annotations(store, doc, 1));
  auto line2 = annotation_ids(line_annotations(store, doc, 2));
  driver.apply_highlights(doc.line_start(1), doc.line_end(1));
  expect_true(annotation_ids(line_annotations(store, doc, 0)) == line0, "line above untouched");
  expect_true(annotation_ids(line_annotations(store, doc, 2)) == line2, "line below untouched");
  auto repainted = annotation_ids(line_annotations(store, doc, 1));
  expect_eq(repainted.size(), 2, "middle line repainted");
  expect_true(repainted != line1, "middle line has fresh annotations");
  expect_eq(store.size(), 6, "no duplicates after partial repaint");
}

void test_driver_region_end_exclusive() {
  csvhue::Document doc("a,b\nc,d");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  driver.apply_highlights(0, doc.line_start(1));
  expect_eq(line_annotations(store, doc, 0).size(), 2, "first line highlighted");
  expect_eq(line_annotations(store, doc, 1).size(), 0, "line starting at region end skipped");
  driver.apply_highlights(doc.size(), doc.line_start(1));
  expect_eq(line_annotations(store, doc, 1).size(), 2, "reversed region is normalized");
}

void test_driver_palette_switch_keeps_boundaries() {
  csvhue::Document doc("one,two,three");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  driver.apply_highlights(0, doc.size());
  auto before = store.all();
  csvhue::PaletteConfig lighter = rgb_palette();
  lighter.use_lighter_palette = true;
  driver.refresh(lighter);
  driver.apply_highlights(0, doc.size());
  auto after = store.all();
  expect_eq(after.size(), before.size(), "palette switch keeps annotation count");
  for (size_t i = 0; i < before.size() && i < after.size(); ++i) {
    expect_true(before[i].start == after[i].start && before[i].end == after[i].end,
                "palette switch keeps field boundaries");
    expect_str(after[i].face.color, lighter.lighter_palette[i], "lighter color applied");
  }
}

void test_driver_refresh_rejects_bad_palette() {
  csvhue::Document doc("a");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  csvhue::PaletteConfig bad = rgb_palette();
  bad.standard_palette = {"#ff0000", "mystery"};
  bool threw = false;
  try {
    driver.refresh(bad);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect_true(threw, "refresh rejects unknown color");
  expect_eq(driver.config().standard_palette.size(), 3, "previous palette retained");
  expect_eq(driver.faces().size(), 3, "previous faces retained");

  bool ctor_threw = false;
  try {
    csvhue::HighlightDriver broken(doc, store, bad);
  } catch (const std::invalid_argument&) {
    ctor_threw = true;
  }
  expect_true(ctor_threw, "constructor rejects unknown color");
}

void test_driver_empty_palette_uses_neutral_face() {
  csvhue::Document doc("a,b");
  csvhue::MemoryAnnotationStore store;
  csvhue::PaletteConfig config;
  config.use_lighter_palette = false;
  csvhue::HighlightDriver driver(doc, store, config);
  driver.apply_highlights(0, doc.size());
  auto all = store.all();
  expect_eq(all.size(), 2, "empty palette still annotates fields");
  for (const auto& annotation : all) {
    expect_str(annotation.face.color, csvhue::kNeutralColor, "neutral color used");
  }
}

void test_driver_continues_after_line_failure() {
  csvhue::Document doc("a,b\nc,d\ne,f");
  RejectingStore store(doc.line_start(1));
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  std::vector<std::string> warnings;
  driver.set_warning_handler([&warnings](const std::string& message) { warnings.push_back(message); });
  driver.apply_highlights(0, doc.size());
  expect_eq(line_annotations(store, doc, 0).size(), 2, "line before failure highlighted");
  expect_eq(line_annotations(store, doc, 1).size(), 0, "failed line left bare");
  expect_eq(line_annotations(store, doc, 2).size(), 2, "line after failure highlighted");
  expect_eq(driver.last_failures().size(), 1, "one failure recorded");
  if (!driver.last_failures().empty()) {
    expect_eq(driver.last_failures()[0].line, 1, "failure line index");
  }
  expect_eq(warnings.size(), 1, "warning handler called once");
  if (!warnings.empty()) {
    expect_true(warnings[0].find("line 2") != std::string::npos, "warning names 1-based line");
  }
  driver.apply_highlights(0, doc.line_end(0));
  expect_eq(driver.last_failures().size(), 0, "failures reset on next run");
}

void test_driver_failed_line_rolls_back_partial_paint() {
  csvhue::Document doc("a,b\nc,d,e\nf,g");
  RejectingStore store(doc.line_start(1) + 2);
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  driver.apply_highlights(0, doc.size());
  expect_eq(driver.last_failures().size(), 1, "second column rejection recorded");
  expect_eq(line_annotations(store, doc, 1).size(), 0, "no partial columns left on failed line");
  expect_eq(line_annotations(store, doc, 0).size(), 2, "line before failure intact");
  expect_eq(line_annotations(store, doc, 2).size(), 2, "line after failure intact");
}

void test_driver_evict_clears_terminator() {
  csvhue::Document doc("a,b\r\nc");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  csvhue::Face face{"csvhue-column-0", "#ff0000", csvhue::Rgb{255, 0, 0}};
  store.create(4, 4, face, csvhue::kAnnotationTag);
  store.create(5, 6, face, csvhue::kAnnotationTag);
  expect_eq(driver.evict(0), 1, "collapsed annotation on line break evicted with its line");
  expect_eq(store.size(), 1, "next line untouched");
}

void test_driver_insert_validates_fields() {
  csvhue::Document doc("ab\ncd");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  bool threw = false;
  try {
    driver.insert(0, {csvhue::Field{0, 1, false}, csvhue::Field{3, 5, false}});
  } catch (const std::out_of_range&) {
    threw = true;
  }
  expect_true(threw, "field outside the line rejected");
  expect_eq(store.size(), 0, "rejected insert creates nothing");
}

void test_driver_clear_keeps_foreign_annotations() {
  csvhue::Document doc("a,b\n,");
  csvhue::MemoryAnnotationStore store;
  csvhue::HighlightDriver driver(doc, store, rgb_palette());
  store.create(0, 1, csvhue::Face{"user", "#ffffff", csvhue::Rgb{255, 255, 255}}, "user");
  driver.apply_highlights(0, doc.size());
  expect_eq(store.size(), 5, "driver annotations plus foreign one");
  expect_eq(driver.evict(1), 2, "evict removes own annotations on line");
  driver.clear();
  expect_eq(store.size(), 1, "clear leaves foreign annotation");
  if (store.size() == 1) {
    expect_str(store.all()[0].tag, "user", "foreign tag survives");
  }
}

}  // namespace

void register_highlight_driver_tests(std::vector<TestCase>& tests) {
  tests.push_back({"driver_colors_columns_in_order", test_driver_colors_columns_in_order});
  tests.push_back({"driver_idempotent", test_driver_idempotent});
  tests.push_back({"driver_region_isolation", test_driver_region_isolation});
  tests.push_back({"driver_region_end_exclusive", test_driver_region_end_exclusive});
  tests.push_back({"driver_palette_switch_keeps_boundaries",
                   test_driver_palette_switch_keeps_boundaries});
  tests.push_back({"driver_refresh_rejects_bad_palette", test_driver_refresh_rejects_bad_palette});
  tests.push_back({"driver_empty_palette_uses_neutral_face",
                   test_driver_empty_palette_uses_neutral_face});
  tests.push_back({"driver_continues_after_line_failure", test_driver_continues_after_line_failure});
  tests.push_back({"driver_failed_line_rolls_back_partial_paint",
                   test_driver_failed_line_rolls_back_partial_paint});
  tests.push_back({"driver_evict_clears_terminator", test_driver_evict_clears_terminator});
  tests.push_back({"driver_insert_validates_fields", test_driver_insert_validates_fields});
  tests.push_back({"driver_clear_keeps_foreign_annotations",
                   test_driver_clear_keeps_foreign_annotations});
}
