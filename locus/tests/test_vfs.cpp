// VFS Test Suite
// Tests VfsResource delegation against an in-memory adapter

#include "locus/locus.hpp"
#include "test_common.hpp"
#include <map>
#include <sstream>
#include <stdexcept>

using locus::ErrorCode;

namespace {

struct FakeNode {
    std::string path;   // identity
    std::string label;  // display only
};

// In-memory provider: node identity is the path, never the label
class FakeAdapter : public locus::VfsAdapter {
public:
    void add(const std::string& path, const std::string& content) { files_[path] = content; }

    locus::VfsHandle node(const std::string& path, const std::string& label = "") const {
        return std::make_shared<FakeNode>(FakeNode{path, label.empty() ? path : label});
    }

    std::unique_ptr<std::istream> open_stream(const locus::VfsHandle& handle) const override {
        auto it = files_.find(as_node(handle).path);
        if (it == files_.end()) {
            throw std::runtime_error("no such node: " + as_node(handle).path);
        }
        return std::make_unique<std::istringstream>(it->second);
    }

    bool exists(const locus::VfsHandle& handle) const override {
        return files_.count(as_node(handle).path) > 0;
    }

    bool readable(const locus::VfsHandle& handle) const override { return exists(handle); }

    std::string url(const locus::VfsHandle& handle) const override {
        const auto& path = as_node(handle).path;
        if (path.find("broken") != std::string::npos) {
            throw std::runtime_error("URL not available");
        }
        return "vfs:" + path;
    }

    std::string uri(const locus::VfsHandle& handle) const override { return url(handle); }

    std::filesystem::path file(const locus::VfsHandle&) const override {
        throw std::runtime_error("node is not backed by a local file");
    }

    std::uint64_t size(const locus::VfsHandle& handle) const override {
        auto it = files_.find(as_node(handle).path);
        if (it == files_.end()) {
            throw std::runtime_error("no such node");
        }
        return it->second.size();
    }

    std::int64_t last_modified(const locus::VfsHandle&) const override { return 42; }

    locus::VfsHandle child(const locus::VfsHandle& handle, const std::string& path) const override {
        ++child_calls;
        std::string full = as_node(handle).path + "/" + path;
        if (files_.count(full) == 0) {
            throw std::runtime_error("no child " + path);
        }
        return node(full);
    }

    locus::VfsHandle relative(const std::string& url) const override {
        ++relative_calls;
        const std::string prefix = "vfs:";
        if (url.compare(0, prefix.size(), prefix) != 0) {
            throw std::runtime_error("foreign URL " + url);
        }
        return node(url.substr(prefix.size()));
    }

    std::string name(const locus::VfsHandle& handle) const override {
        const auto& path = as_node(handle).path;
        return path.substr(path.rfind('/') + 1);
    }

    bool equal(const locus::VfsHandle& a, const locus::VfsHandle& b) const override {
        return as_node(a).path == as_node(b).path;
    }

    std::size_t hash(const locus::VfsHandle& handle) const override {
        return std::hash<std::string>{}(as_node(handle).path);
    }

    std::string describe(const locus::VfsHandle& handle) const override { return as_node(handle).label; }

    mutable int child_calls = 0;
    mutable int relative_calls = 0;

private:
    static const FakeNode& as_node(const locus::VfsHandle& handle) {
        return *static_cast<const FakeNode*>(handle.get());
    }

    std::map<std::string, std::string> files_;
};

// Provider whose handles are single bytes, unrelated to FakeNode
class ByteAdapter : public locus::VfsAdapter {
public:
    locus::VfsHandle node(char id) const { return std::make_shared<char>(id); }

    std::unique_ptr<std::istream> open_stream(const locus::VfsHandle& handle) const override {
        return std::make_unique<std::istringstream>(std::string(1, as_byte(handle)));
    }
    bool exists(const locus::VfsHandle&) const override { return true; }
    bool readable(const locus::VfsHandle&) const override { return true; }
    std::string url(const locus::VfsHandle& handle) const override { return std::string("byte:") + as_byte(handle); }
    std::string uri(const locus::VfsHandle& handle) const override { return url(handle); }
    std::filesystem::path file(const locus::VfsHandle&) const override {
        throw std::runtime_error("no local file");
    }
    std::uint64_t size(const locus::VfsHandle&) const override { return 1; }
    std::int64_t last_modified(const locus::VfsHandle&) const override { return 0; }
    locus::VfsHandle child(const locus::VfsHandle&, const std::string&) const override {
        throw std::runtime_error("no children");
    }
    locus::VfsHandle relative(const std::string&) const override {
        throw std::runtime_error("no relatives");
    }
    std::string name(const locus::VfsHandle& handle) const override { return std::string(1, as_byte(handle)); }

    bool equal(const locus::VfsHandle& a, const locus::VfsHandle& b) const override {
        ++equal_calls;
        return as_byte(a) == as_byte(b);
    }
    std::size_t hash(const locus::VfsHandle& handle) const override { return std::hash<char>{}(as_byte(handle)); }
    std::string describe(const locus::VfsHandle& handle) const override { return name(handle); }

    mutable int equal_calls = 0;

private:
    static char as_byte(const locus::VfsHandle& handle) { return *static_cast<const char*>(handle.get()); }
};

std::shared_ptr<FakeAdapter> make_adapter() {
    auto adapter = std::make_shared<FakeAdapter>();
    adapter->add("/root/a.txt", "alpha");
    adapter->add("/root/sub/c.txt", "gamma");
    adapter->add("/b.txt", "beta");
    return adapter;
}

} // anonymous namespace

// ============================================================================
// Delegation Tests
// ============================================================================

void test_vfs_delegation() {
    std::cout << "  test_vfs_delegation..." << std::endl;

    auto adapter = make_adapter();
    locus::VfsResource resource(adapter->node("/root/a.txt", "archive!/root/a.txt"), adapter);

    ASSERT_TRUE(resource.exists());
    ASSERT_TRUE(resource.readable());
    ASSERT_EQ(resource.content_length(), 5u);
    ASSERT_EQ(resource.last_modified(), 42);
    ASSERT_EQ(*resource.filename(), "a.txt");
    ASSERT_EQ(read_all(*resource.open_stream()), "alpha");
    ASSERT_EQ(resource.get_url().to_string(), "vfs:/root/a.txt");
    ASSERT_EQ(resource.get_uri(), "vfs:/root/a.txt");
    ASSERT_EQ(resource.description(), "VFS resource [archive!/root/a.txt]");
}

void test_vfs_null_arguments() {
    std::cout << "  test_vfs_null_arguments..." << std::endl;

    auto adapter = make_adapter();
    ASSERT_THROWS_CODE(locus::VfsResource(nullptr, adapter), ErrorCode::AdapterFailure);
    ASSERT_THROWS_CODE(locus::VfsResource(adapter->node("/b.txt"), nullptr), ErrorCode::AdapterFailure);
}

void test_vfs_failures_are_wrapped() {
    std::cout << "  test_vfs_failures_are_wrapped..." << std::endl;

    auto adapter = make_adapter();
    locus::VfsResource missing(adapter->node("/root/missing.txt"), adapter);
    locus::VfsResource broken(adapter->node("/broken/x.txt"), adapter);

    ASSERT_FALSE(missing.exists());
    ASSERT_THROWS_CODE(missing.open_stream(), ErrorCode::AdapterFailure);
    ASSERT_THROWS_CODE(missing.content_length(), ErrorCode::AdapterFailure);
    ASSERT_THROWS_CODE(missing.get_file(), ErrorCode::AdapterFailure);
    ASSERT_THROWS_CODE(broken.get_url(), ErrorCode::AdapterFailure);
    ASSERT_THROWS_CODE(broken.get_uri(), ErrorCode::AdapterFailure);

    // The provider's exception is kept as the cause
    try {
        missing.get_file();
        ASSERT_TRUE(false);
    } catch (const locus::LocusError& e) {
        ASSERT_TRUE(e.cause() != nullptr);
        ASSERT_THROWS(e.rethrow_cause(), std::runtime_error);
        ASSERT_TRUE(std::string(e.what()).find("not backed by a local file") != std::string::npos);
    }
}

void run_delegation_tests() {
    std::cout << "=== VFS Delegation Tests ===" << std::endl;
    test_vfs_delegation();
    test_vfs_null_arguments();
    test_vfs_failures_are_wrapped();
    std::cout << "  All delegation tests PASSED" << std::endl << std::endl;
}

// ============================================================================
// Relative Resolution Tests
// ============================================================================

void test_vfs_child_lookup() {
    std::cout << "  test_vfs_child_lookup..." << std::endl;

    auto adapter = make_adapter();
    locus::VfsResource root(adapter->node("/root"), adapter);

    auto child = root.create_relative("sub/c.txt");
    ASSERT_EQ(adapter->child_calls, 1);
    ASSERT_EQ(adapter->relative_calls, 0);
    ASSERT_EQ(read_all(*child->open_stream()), "gamma");
}

void test_vfs_url_relative_fallback() {
    std::cout << "  test_vfs_url_relative_fallback..." << std::endl;

    auto adapter = make_adapter();
    locus::VfsResource a(adapter->node("/root/a.txt"), adapter);

    // Child lookup fails, URL-relative lookup succeeds
    auto sibling = a.create_relative("sub/../a.txt");
    ASSERT_EQ(adapter->child_calls, 1);
    ASSERT_EQ(adapter->relative_calls, 1);
    ASSERT_TRUE(*sibling == a);

    // Dot-prefixed paths and paths without '/' skip the child lookup
    auto parent = a.create_relative("../b.txt");
    ASSERT_EQ(adapter->child_calls, 1);
    ASSERT_EQ(adapter->relative_calls, 2);
    ASSERT_EQ(read_all(*parent->open_stream()), "beta");

    auto plain = a.create_relative("b.txt");
    ASSERT_EQ(adapter->child_calls, 1);
    ASSERT_EQ(plain->get_url().to_string(), "vfs:/root/b.txt");
    ASSERT_FALSE(plain->exists());
}

void run_relative_tests() {
    std::cout << "=== VFS Relative Resolution Tests ===" << std::endl;
    test_vfs_child_lookup();
    test_vfs_url_relative_fallback();
    std::cout << "  All relative resolution tests PASSED" << std::endl << std::endl;
}

// ============================================================================
// Equality Tests
// ============================================================================

void test_vfs_equality_uses_handles() {
    std::cout << "  test_vfs_equality_uses_handles..." << std::endl;

    auto adapter = make_adapter();
    locus::VfsResource first(adapter->node("/b.txt", "label one"), adapter);
    locus::VfsResource second(adapter->node("/b.txt", "label two"), adapter);
    locus::VfsResource other(adapter->node("/root/a.txt", "label one"), adapter);

    ASSERT_TRUE(first.description() != second.description());
    ASSERT_TRUE(first == second);
    ASSERT_EQ(first.hash(), second.hash());

    ASSERT_TRUE(first.description() == other.description());
    ASSERT_TRUE(first != other);

    // Same description, different kind of resource
    locus::ByteArrayResource bytes(std::string("beta"), "x");
    ASSERT_TRUE(first != bytes);
}

void test_vfs_equality_across_adapters() {
    std::cout << "  test_vfs_equality_across_adapters..." << std::endl;

    auto fake = make_adapter();
    auto bytes = std::make_shared<ByteAdapter>();
    locus::VfsResource node(fake->node("/b.txt"), fake);
    locus::VfsResource byte(bytes->node('b'), bytes);

    // Each adapter only ever sees its own handles
    ASSERT_TRUE(node != byte);
    ASSERT_TRUE(byte != node);
    ASSERT_EQ(bytes->equal_calls, 0);

    // Separate adapter instances of one type still compare handles
    auto other_fake = make_adapter();
    locus::VfsResource same_path(other_fake->node("/b.txt", "elsewhere"), other_fake);
    ASSERT_TRUE(node == same_path);

    locus::VfsResource same_byte(bytes->node('b'), bytes);
    ASSERT_TRUE(byte == same_byte);
    ASSERT_EQ(bytes->equal_calls, 1);
}

void run_equality_tests() {
    std::cout << "=== VFS Equality Tests ===" << std::endl;
    test_vfs_equality_uses_handles();
    test_vfs_equality_across_adapters();
    std::cout << "  All equality tests PASSED" << std::endl << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::cout << "========================================" << std::endl;
    std::cout << "VFS Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        run_delegation_tests();
        run_relative_tests();
        run_equality_tests();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests completed successfully!" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
