#include "test_harness.h"

#include <stdexcept>
#include <string>
#include <vector>

#include "csvhue/annotation_store.h"

namespace {

csvhue::Face plain_face() {
  return csvhue::Face{"test-face", "#ffffff", csvhue::Rgb{255, 255, 255}};
}

void test_store_create_orders_by_start() {
  csvhue::MemoryAnnotationStore store;
  store.create(10, 12, plain_face(), "t");
  store.create(0, 3, plain_face(), "t");
  store.create(5, 5, plain_face(), "t");
  auto all = store.all();
  expect_eq(all.size(), 3, "three annotations stored");
  if (all.size() == 3) {
    expect_eq(all[0].start, 0, "first by start");
    expect_eq(all[1].start, 5, "second by start");
    expect_eq(all[2].start, 10, "third by start");
    expect_true(all[0].id != all[1].id && all[1].id != all[2].id, "ids are unique");
  }
}

void test_store_create_rejects_reversed_range() {
  csvhue::MemoryAnnotationStore store;
  bool threw = false;
  try {
    store.create(4, 2, plain_face(), "t");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect_true(threw, "reversed range throws");
  expect_eq(store.size(), 0, "nothing stored after rejection");
}

void test_store_remove_matching_by_tag_and_range() {
  csvhue::MemoryAnnotationStore store;
  store.create(0, 3, plain_face(), "csvhue");
  store.create(4, 6, plain_face(), "csvhue");
  store.create(1, 2, plain_face(), "other");
  size_t removed = store.remove_matching(0, 3, "csvhue");
  expect_eq(removed, 1, "only tagged annotation in range removed");
  expect_eq(store.size(), 2, "foreign tag and outside range kept");
  expect_eq(store.remove_matching(100, 200, "csvhue"), 0, "removing nothing succeeds");
}

void test_store_remove_matching_zero_width() {
  csvhue::MemoryAnnotationStore store;
  store.create(5, 5, plain_face(), "csvhue");
  expect_eq(store.remove_matching(5, 5, "csvhue"), 1, "empty range removes zero-width annotation");
}

void test_store_track_insert() {
  csvhue::MemoryAnnotationStore store;
  store.create(0, 3, plain_face(), "t");
  store.create(5, 8, plain_face(), "t");
  store.track_edit(csvhue::EditEvent{4, 0, 2});
  auto all = store.all();
  if (all.size() == 2) {
    expect_true(all[0].start == 0 && all[0].end == 3, "annotation before insert unchanged");
    expect_true(all[1].start == 7 && all[1].end == 10, "annotation after insert shifted");
  }
  store.track_edit(csvhue::EditEvent{7, 0, 1});
  all = store.all();
  if (all.size() == 2) {
    expect_true(all[1].start == 7 && all[1].end == 11, "insert at annotation start grows it");
  }
}

void test_store_track_erase() {
  csvhue::MemoryAnnotationStore store;
  store.create(0, 3, plain_face(), "t");
  store.create(5, 8, plain_face(), "t");
  store.track_edit(csvhue::EditEvent{1, 4, 0});
  auto all = store.all();
  expect_eq(all.size(), 2, "erase keeps annotations");
  if (all.size() == 2) {
    expect_true(all[0].start == 0 && all[0].end == 1, "end inside erased span collapses");
    expect_true(all[1].start == 1 && all[1].end == 4, "annotation after erase shifted back");
  }
}

void test_store_in_range() {
  csvhue::MemoryAnnotationStore store;
  store.create(0, 2, plain_face(), "t");
  store.create(4, 6, plain_face(), "t");
  store.create(8, 9, plain_face(), "t");
  auto hits = store.in_range(3, 7);
  expect_eq(hits.size(), 1, "in_range returns overlapping annotations only");
  if (!hits.empty()) {
    expect_eq(hits[0].start, 4, "in_range hit");
  }
  store.clear();
  expect_eq(store.size(), 0, "clear empties store");
}

}  // namespace

void register_annotation_store_tests(std::vector<TestCase>& tests) {
  tests.push_back({"store_create_orders_by_start", test_store_create_orders_by_start});
  tests.push_back({"store_create_rejects_reversed_range", test_store_create_rejects_reversed_range});
  tests.push_back({"store_remove_matching_by_tag_and_range",
                   test_store_remove_matching_by_tag_and_range});
  tests.push_back({"store_remove_matching_zero_width", test_store_remove_matching_zero_width});
  tests.push_back({"store_track_insert", test_store_track_insert});
  tests.push_back({"store_track_erase", test_store_track_erase});
  tests.push_back({"store_in_range", test_store_in_range});
}
