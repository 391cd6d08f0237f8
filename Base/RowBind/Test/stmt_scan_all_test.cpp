#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "memory_statement.h"
#include "rowbind/scannable_containers.h"
#include "rowbind/stmt_scan.h"

namespace rowbind {

    namespace {

        struct Person : ISingleScannable {
            int32_t id = 0;
            std::string name;
            std::optional<double> score;

            std::vector<ScanTarget> scanTargets() override {
                return {&id, &name, &score};
            }
        };

        std::vector<SqlValue> personRow(int32_t id, const std::string& name, SqlValue score) {
            return {SqlValue(id), SqlValue(name), std::move(score)};
        }

        // newElement() 在第 throw_at 次调用时抛出
        class ThrowingAccumulator : public IMultiScannable {
          public:
            explicit ThrowingAccumulator(int throw_at) : m_throw_at(throw_at) {
            }
            ISingleScannable& newElement() override {
                if (++m_calls == m_throw_at) {
                    throw std::runtime_error("accumulator is full");
                }
                return m_items.emplace_back();
            }
            std::vector<Person>& items() {
                return m_items;
            }

          private:
            int m_throw_at;
            int m_calls = 0;
            std::vector<Person> m_items;
        };

        struct ThrowingBinder : ISingleScannable {
            std::vector<ScanTarget> scanTargets() override {
                throw std::logic_error("binder not ready");
            }
        };

    }  // namespace

    class StmtScanAllTest : public ::testing::Test {
      protected:
        void SetUp() override {
            stmt.rows = {personRow(1, "ada", 9.5), personRow(2, "grace", SqlValue()), personRow(3, "linus", 7.25)};
        }

        MemoryStatementExecutor stmt;
        ScannableVector<Person> people;
    };

    TEST_F(StmtScanAllTest, BindsEveryRowInOrder) {
        Error err = stmtScanAll(stmt, people);
        ASSERT_FALSE(err) << err.toString();
        ASSERT_EQ(people.size(), 3);
        EXPECT_EQ(people[0].id, 1);
        EXPECT_EQ(people[0].name, "ada");
        EXPECT_EQ(people[0].score, 9.5);
        EXPECT_EQ(people[1].id, 2);
        EXPECT_EQ(people[1].name, "grace");
        EXPECT_FALSE(people[1].score.has_value());
        EXPECT_EQ(people[2].id, 3);
        EXPECT_EQ(people[2].name, "linus");
        EXPECT_EQ(people[2].score, 7.25);
        EXPECT_EQ(stmt.execute_calls, 1);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, ForwardsArgumentsToExecutor) {
        Error err = stmtScanAll(stmt, people, 42, "active", nullptr);
        ASSERT_FALSE(err) << err.toString();
        ASSERT_EQ(stmt.last_args.size(), 3);
        EXPECT_EQ(stmt.last_args[0], SqlValue(42));
        EXPECT_EQ(stmt.last_args[1], SqlValue("active"));
        EXPECT_TRUE(stmt.last_args[2].isNull());

        std::vector<SqlValue> args = {SqlValue(int64_t{7})};
        err = stmtScanAll(stmt, people, args);
        ASSERT_FALSE(err) << err.toString();
        EXPECT_EQ(stmt.last_args, args);
    }

    TEST_F(StmtScanAllTest, EmptyResultLeavesAccumulatorUnchanged) {
        stmt.rows.clear();
        people.newElement();
        Error err = stmtScanAll(stmt, people);
        EXPECT_FALSE(err) << err.toString();
        EXPECT_EQ(people.size(), 1);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, ExecutionFailureSkipsRelease) {
        stmt.execute_error = Error(ErrorCode::ExecutionError, "syntax error near SELEC", 1064, "42000");
        Error err = stmtScanAll(stmt, people, 1);
        EXPECT_EQ(err.code, ErrorCode::ExecutionError);
        EXPECT_EQ(err.message, "syntax error near SELEC");
        EXPECT_EQ(err.native_db_error_code, 1064);
        EXPECT_EQ(err.sql_state, "42000");
        EXPECT_TRUE(people.empty());
        EXPECT_EQ(stmt.cursors_created, 0);
        EXPECT_EQ(stmt.close_calls, 0);
    }

    TEST_F(StmtScanAllTest, NullCursorIsInternalError) {
        stmt.return_null_cursor = true;
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::InternalError);
        EXPECT_TRUE(people.empty());
        EXPECT_EQ(stmt.close_calls, 0);
    }

    TEST_F(StmtScanAllTest, ScanFailureStopsAtFailingRow) {
        stmt.fail_scan_at_row = 1;
        stmt.scan_error = Error(ErrorCode::ScanError, "column 0: cannot scan string into int32_t");
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        EXPECT_EQ(err.message, "column 0: cannot scan string into int32_t");
        // 第一行已填充, 第二行元素已分配但未填充, 第三行从未读取
        ASSERT_EQ(people.size(), 2);
        EXPECT_EQ(people[0].id, 1);
        EXPECT_EQ(people[0].name, "ada");
        EXPECT_EQ(people[1].id, 0);
        EXPECT_TRUE(people[1].name.empty());
        EXPECT_EQ(stmt.rows_fetched, 2);
        EXPECT_EQ(stmt.scan_calls, 2);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, ConversionFailureReportsRowAndColumn) {
        stmt.rows[1][0] = SqlValue("two");
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        ASSERT_TRUE(err.row_index.has_value());
        EXPECT_EQ(*err.row_index, 1);
        ASSERT_TRUE(err.column_index.has_value());
        EXPECT_EQ(*err.column_index, 0);
        EXPECT_EQ(people.size(), 2);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, NullIntoNonNullableFieldFails) {
        stmt.rows[0][1] = SqlValue();
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        EXPECT_NE(err.message.find("cannot scan NULL"), std::string::npos);
        EXPECT_EQ(people.size(), 1);
        EXPECT_EQ(stmt.rows_fetched, 1);
    }

    TEST_F(StmtScanAllTest, ColumnCountMismatchIsScanError) {
        stmt.rows = {{SqlValue(1), SqlValue("ada")}};
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        EXPECT_NE(err.message.find("expected 2 destination arguments"), std::string::npos);
        EXPECT_EQ(people.size(), 1);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, TerminalErrorAfterExhaustion) {
        stmt.rows.pop_back();
        stmt.terminal_error = Error(ErrorCode::TerminalCursorError, "connection reset while streaming", 2013, "HY000");
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::TerminalCursorError);
        EXPECT_EQ(err.native_db_error_code, 2013);
        ASSERT_EQ(people.size(), 2);
        EXPECT_EQ(people[0].name, "ada");
        EXPECT_EQ(people[1].name, "grace");
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, ReleaseErrorReturnedWhenNothingElseFailed) {
        stmt.close_error = Error(ErrorCode::CursorReleaseError, "free_result failed");
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::CursorReleaseError);
        EXPECT_EQ(err.message, "free_result failed");
        EXPECT_EQ(people.size(), 3);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, ReleaseErrorOfOtherCodeIsReclassified) {
        stmt.close_error = Error(ErrorCode::InternalError, "socket gone");
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::CursorReleaseError);
        EXPECT_NE(err.message.find("socket gone"), std::string::npos);
    }

    TEST_F(StmtScanAllTest, ReleaseErrorIsMaskedByEarlierFailure) {
        stmt.close_error = Error(ErrorCode::CursorReleaseError, "free_result failed");
        stmt.fail_scan_at_row = 0;
        Error err = stmtScanAll(stmt, people);
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        EXPECT_EQ(stmt.close_calls, 1);

        ScannableVector<Person> more_people;
        stmt.fail_scan_at_row.reset();
        stmt.terminal_error = Error(ErrorCode::TerminalCursorError, "lost connection");
        err = stmtScanAll(stmt, more_people);
        EXPECT_EQ(err.code, ErrorCode::TerminalCursorError);
        EXPECT_EQ(more_people.size(), 3);
        EXPECT_EQ(stmt.close_calls, 2);
    }

    TEST_F(StmtScanAllTest, AccumulatorExceptionStillReleasesCursor) {
        ThrowingAccumulator accumulator(2);
        EXPECT_THROW(stmtScanAll(stmt, accumulator), std::runtime_error);
        EXPECT_EQ(accumulator.items().size(), 1);
        EXPECT_EQ(accumulator.items()[0].id, 1);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, BinderExceptionStillReleasesCursor) {
        ScannableVector<ThrowingBinder> binders;
        EXPECT_THROW(stmtScanAll(stmt, binders), std::logic_error);
        EXPECT_EQ(binders.size(), 1);
        EXPECT_EQ(stmt.scan_calls, 0);
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, PreservesOrderForManyRows) {
        constexpr int32_t kRows = 1000;
        stmt.rows.clear();
        for (int32_t i = 0; i < kRows; ++i) {
            stmt.rows.push_back(personRow(i, "p" + std::to_string(i), SqlValue(i * 0.5)));
        }
        Error err = stmtScanAll(stmt, people);
        ASSERT_FALSE(err) << err.toString();
        ASSERT_EQ(people.size(), kRows);
        for (int32_t i = 0; i < kRows; ++i) {
            EXPECT_EQ(people[i].id, i);
            EXPECT_EQ(people[i].name, "p" + std::to_string(i));
        }
        EXPECT_EQ(stmt.close_calls, 1);
    }

    TEST_F(StmtScanAllTest, PolymorphicElementsThroughFactory) {
        struct Named : ISingleScannable {
            virtual std::string label() const = 0;
        };
        struct Employee : Named {
            int64_t id = 0;
            std::string name;
            std::optional<std::string> team;
            std::vector<ScanTarget> scanTargets() override {
                return {&id, &name, &team};
            }
            std::string label() const override {
                return std::to_string(id) + ":" + name;
            }
        };

        stmt.rows = {{SqlValue(10), SqlValue("ken"), SqlValue("infra")}, {SqlValue(11), SqlValue("rob"), SqlValue()}};
        int created = 0;
        FactoryScannable<Named> staff([&created]() -> std::unique_ptr<Named> {
            ++created;
            return std::make_unique<Employee>();
        });
        Error err = stmtScanAll(stmt, staff);
        ASSERT_FALSE(err) << err.toString();
        EXPECT_EQ(created, 2);
        ASSERT_EQ(staff.size(), 2);
        EXPECT_EQ(staff[0].label(), "10:ken");
        EXPECT_EQ(staff[1].label(), "11:rob");
    }

}  // namespace rowbind
