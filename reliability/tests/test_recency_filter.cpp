#include <catch2/catch_test_macros.hpp>
#include "../src/recency_filter.hpp"

namespace {
const CalendarDate AS_OF{2024, 6, 1};

Article article(const std::string& title, std::optional<std::string> published) {
    Article a;
    a.title = title;
    a.source = "Newswire";
    a.published_date = std::move(published);
    return a;
}

InsiderTransaction transaction(std::optional<std::string> name, const std::string& date) {
    InsiderTransaction txn;
    txn.name = std::move(name);
    txn.title = "CFO";
    txn.transaction_type = "Sale";
    txn.shares = 1000.0;
    txn.transaction_date = date;
    return txn;
}

std::vector<std::string> titles(const std::vector<Article>& articles) {
    std::vector<std::string> out;
    for (const auto& a : articles) out.push_back(a.title.value_or(""));
    return out;
}

std::vector<std::string> names(const std::vector<InsiderTransaction>& txns) {
    std::vector<std::string> out;
    for (const auto& t : txns) out.push_back(t.name.value_or(""));
    return out;
}
}

TEST_CASE("Recent article selection", "[recency_filter]") {
    SECTION("Recent kept, stale and undated dropped") {
        std::vector<Article> articles = {
            article("recent", std::string("2024-05-01")),
            article("stale", std::string("2023-01-01")),
            article("garbled", std::string("last Tuesday")),
            article("undated", std::nullopt)
        };
        
        auto recent = RecencyFilter::filter_recent_articles(articles, AS_OF);
        REQUIRE(titles(recent) == std::vector<std::string>{"recent"});
    }
    
    SECTION("Window boundary is inclusive") {
        std::vector<Article> articles = {
            article("day-120", std::string("2024-02-02")),
            article("day-121", std::string("2024-02-01"))
        };
        
        auto recent = RecencyFilter::filter_recent_articles(articles, AS_OF, 120);
        REQUIRE(titles(recent) == std::vector<std::string>{"day-120"});
    }
    
    SECTION("Input order preserved across formats") {
        std::vector<Article> articles = {
            article("c", std::string("2024-05-20T08:00:00Z")),
            article("a", std::string("2024-04-01 12:00:00")),
            article("b", std::string("2024-05-30T09:15:00.250+02:00"))
        };
        
        auto recent = RecencyFilter::filter_recent_articles(articles, AS_OF);
        REQUIRE(titles(recent) == std::vector<std::string>{"c", "a", "b"});
    }
    
    SECTION("Future-dated articles are not stale") {
        std::vector<Article> articles = {article("future", std::string("2024-07-01"))};
        REQUIRE(RecencyFilter::filter_recent_articles(articles, AS_OF).size() == 1);
    }
    
    SECTION("Empty input gives empty output") {
        REQUIRE(RecencyFilter::filter_recent_articles({}, AS_OF).empty());
    }
    
    SECTION("Filtering is idempotent") {
        std::vector<Article> articles = {
            article("one", std::string("2024-05-01")),
            article("two", std::string("2022-05-01")),
            article("three", std::string("2024-03-15T10:00:00"))
        };
        
        auto once = RecencyFilter::filter_recent_articles(articles, AS_OF);
        auto twice = RecencyFilter::filter_recent_articles(once, AS_OF);
        REQUIRE(titles(once) == titles(twice));
    }
}

TEST_CASE("Placeholder insider names", "[recency_filter]") {
    std::vector<InsiderTransaction> txns = {
        transaction(std::string("John Doe"), "2024-05-01"),
        transaction(std::string("  JANE SMITH "), "2024-05-01"),
        transaction(std::string("Alice Johnson"), "2024-05-01"),
        transaction(std::string("   "), "2024-05-01"),
        transaction(std::nullopt, "2024-05-01"),
        transaction(std::string("Maria Chen"), "2024-05-01")
    };
    
    SECTION("Built-in placeholders dropped") {
        auto valid = RecencyFilter::filter_valid_transactions(txns);
        REQUIRE(valid.size() == 1);
        REQUIRE(valid[0].name == std::optional<std::string>("Maria Chen"));
    }
    
    SECTION("Caller-supplied placeholder set") {
        PlaceholderNames names = {"maria chen"};
        auto valid = RecencyFilter::filter_valid_transactions(txns, names);
        REQUIRE(valid.size() == 3);
        REQUIRE(valid[0].name == std::optional<std::string>("John Doe"));
    }
    
    SECTION("Caller-supplied entries match regardless of case") {
        PlaceholderNames listed = {"Maria Chen", "  JOHN DOE  "};
        auto valid = RecencyFilter::filter_valid_transactions(txns, listed);
        REQUIRE(names(valid) == std::vector<std::string>{"  JANE SMITH ", "Alice Johnson"});
        
        auto recent = RecencyFilter::filter_recent_transactions(txns, AS_OF, 365, listed);
        REQUIRE(names(recent) == names(valid));
    }
    
    SECTION("Filtering is idempotent") {
        auto once = RecencyFilter::filter_valid_transactions(txns);
        auto twice = RecencyFilter::filter_valid_transactions(once);
        REQUIRE(once.size() == twice.size());
    }
}

TEST_CASE("Recent insider transactions", "[recency_filter]") {
    SECTION("One-year default window") {
        std::vector<InsiderTransaction> txns = {
            transaction(std::string("Maria Chen"), "2023-06-02"),
            transaction(std::string("Tom Baker"), "2023-06-01"),
            transaction(std::string("Ravi Patel"), "2024-05-15T16:30:00Z")
        };
        
        auto recent = RecencyFilter::filter_recent_transactions(txns, AS_OF);
        REQUIRE(recent.size() == 2);
        REQUIRE(recent[0].name == std::optional<std::string>("Maria Chen"));
        REQUIRE(recent[1].name == std::optional<std::string>("Ravi Patel"));
    }
    
    SECTION("Placeholders dropped even when recent") {
        std::vector<InsiderTransaction> txns = {
            transaction(std::string("john doe"), "2024-05-30"),
            transaction(std::string("Maria Chen"), "not a date")
        };
        
        REQUIRE(RecencyFilter::filter_recent_transactions(txns, AS_OF).empty());
    }
    
    SECTION("Custom window") {
        std::vector<InsiderTransaction> txns = {
            transaction(std::string("Maria Chen"), "2024-05-01")
        };
        
        REQUIRE(RecencyFilter::filter_recent_transactions(txns, AS_OF, 30).empty());
        REQUIRE(RecencyFilter::filter_recent_transactions(txns, AS_OF, 31).size() == 1);
    }
    
    SECTION("Filtering is idempotent") {
        std::vector<InsiderTransaction> txns = {
            transaction(std::string("Jane Smith"), "2024-05-10"),
            transaction(std::string("Tom Baker"), "2022-01-01"),
            transaction(std::string("Ravi Patel"), "sometime"),
            transaction(std::string("Maria Chen"), "2024-04-20T09:00:00Z"),
            transaction(std::string("Lena Ortiz"), "2024-01-05")
        };
        
        auto once = RecencyFilter::filter_recent_transactions(txns, AS_OF);
        auto twice = RecencyFilter::filter_recent_transactions(once, AS_OF);
        REQUIRE(names(once) == std::vector<std::string>{"Maria Chen", "Lena Ortiz"});
        REQUIRE(names(twice) == names(once));
    }
}
