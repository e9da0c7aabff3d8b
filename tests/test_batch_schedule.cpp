#include <vector>
#include <iostream>
#include <stdexcept>
#include "BatchSchedule.hpp"
#include "tests/helpers.h"

static int count_examples(const std::vector<BatchRange>& batches) {
    int total = 0;
    for (size_t i = 0; i < batches.size(); ++i) total += batches[i].size;
    return total;
}

static void test_remainder_batch() {
    TEST_HEADER("n=21, batch_size=20: one full batch plus a remainder of 1");
    std::vector<BatchRange> batches = BatchSchedule::create(21, 20);
    EXPECT_TRUE(batches.size() == 2, "two batches");
    EXPECT_TRUE(batches[0].start == 0 && batches[0].size == 20, "full batch");
    EXPECT_TRUE(batches[1].start == 20 && batches[1].size == 1, "remainder batch");
    EXPECT_TRUE(count_examples(batches) == 21, "21 examples per epoch");
}

static void test_exact_division_has_no_remainder() {
    TEST_HEADER("n=40, batch_size=20: no remainder batch");
    std::vector<BatchRange> batches = BatchSchedule::create(40, 20);
    EXPECT_TRUE(batches.size() == 2, "two full batches");
    EXPECT_TRUE(batches[1].start == 20 && batches[1].size == 20, "second batch");
    EXPECT_TRUE(count_examples(batches) == 40, "each example visited once");
}

static void test_batch_larger_than_dataset() {
    TEST_HEADER("n=4, batch_size=5: a single remainder batch over everything");
    std::vector<BatchRange> batches = BatchSchedule::create(4, 5);
    EXPECT_TRUE(batches.size() == 1, "one batch");
    EXPECT_TRUE(batches[0].start == 0 && batches[0].size == 4, "covers all rows");
}

static void test_contiguous_order() {
    TEST_HEADER("n=45, batch_size=20: batches are contiguous and ordered");
    std::vector<BatchRange> batches = BatchSchedule::create(45, 20);
    EXPECT_TRUE(batches.size() == 3, "three batches");
    int expected_start = 0;
    for (size_t i = 0; i < batches.size(); ++i) {
        EXPECT_TRUE(batches[i].start == expected_start, "batch " + std::to_string(i) + " start");
        expected_start += batches[i].size;
    }
    EXPECT_TRUE(batches[2].size == 5, "remainder size");
}

static void test_invalid_arguments() {
    TEST_HEADER("invalid arguments");
    EXPECT_THROWS(BatchSchedule::create(0, 20), std::invalid_argument, "empty dataset");
    EXPECT_THROWS(BatchSchedule::create(10, 0), std::invalid_argument, "zero batch size");
}

int main() {
    try {
        test_remainder_batch();
        test_exact_division_has_no_remainder();
        test_batch_larger_than_dataset();
        test_contiguous_order();
        test_invalid_arguments();
        return report_results("test_batch_schedule");
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        return 2;
    }
}
