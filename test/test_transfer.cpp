#include <gtest/gtest.h>
#include "transfer.hpp"
#include "security.hpp"
#include "protocol/mime.hpp"
#include <fstream>
#include <iterator>
#include <mutex>

namespace fs = std::filesystem;
using boost::asio::ip::tcp;

namespace {

fs::path makeTempDir(const std::string& prefix) {
    fs::path dir = fs::temp_directory_path() / (prefix + security::random_hex(8));
    fs::create_directories(dir);
    return dir;
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

networking::Device localDevice(unsigned short port) {
    networking::Device device;
    device.id = "peer00000001";
    device.name = "loopback";
    device.address = "127.0.0.1";
    device.http_port = port;
    device.last_seen = std::chrono::system_clock::now();
    return device;
}

} // namespace

// -----------------------
// FILENAMES
// -----------------------
TEST(SanitizeFilenameTest, KeepsPlainNames) {
    EXPECT_EQ(transfer::sanitize_filename("report.pdf"), "report.pdf");
    EXPECT_EQ(transfer::sanitize_filename("my photo (1).jpg"), "my photo (1).jpg");
    EXPECT_EQ(transfer::sanitize_filename("\xD0\xBF\xD1\x80\xD0\xB8.txt"), "\xD0\xBF\xD1\x80\xD0\xB8.txt");
}

TEST(SanitizeFilenameTest, StripsDirectoryComponents) {
    EXPECT_EQ(transfer::sanitize_filename("../../evil.txt"), "evil.txt");
    EXPECT_EQ(transfer::sanitize_filename("/etc/passwd"), "passwd");
    EXPECT_EQ(transfer::sanitize_filename("C:\\Users\\me\\doc.txt"), "doc.txt");
    EXPECT_EQ(transfer::sanitize_filename("a/b\\c.bin"), "c.bin");
}

TEST(SanitizeFilenameTest, DropsControlCharacters) {
    EXPECT_EQ(transfer::sanitize_filename("bad\r\nname\t.txt"), "badname.txt");
    EXPECT_EQ(transfer::sanitize_filename(std::string("nul\0byte", 8)), "nulbyte");
}

TEST(SanitizeFilenameTest, FallsBackWhenNothingIsLeft) {
    for (const std::string raw : {"", "..", ".", "../", "   ", "dir/"}) {
        std::string name = transfer::sanitize_filename(raw);
        EXPECT_EQ(name.rfind("file_", 0), 0u) << "input '" << raw << "'";
        EXPECT_GT(name.size(), 5u);
    }
}

TEST(ReserveDestinationTest, UsesNameWhenFree) {
    fs::path dir = makeTempDir("peerdrop_reserve_");
    fs::path path = transfer::reserve_destination(dir, "a.txt");
    EXPECT_EQ(path, dir / "a.txt");
    EXPECT_TRUE(fs::exists(path));
    fs::remove_all(dir);
}

TEST(ReserveDestinationTest, AddsSuffixOnCollision) {
    fs::path dir = makeTempDir("peerdrop_reserve_");
    writeFile(dir / "a.txt", "existing");

    fs::path path = transfer::reserve_destination(dir, "a.txt");
    EXPECT_NE(path, dir / "a.txt");
    EXPECT_EQ(path.parent_path(), dir);
    EXPECT_EQ(path.extension(), ".txt");
    EXPECT_EQ(path.stem().string().rfind("a_", 0), 0u);
    EXPECT_EQ(readFile(dir / "a.txt"), "existing");

    fs::path another = transfer::reserve_destination(dir, "a.txt");
    EXPECT_NE(another, path);
    fs::remove_all(dir);
}

TEST(ReserveDestinationTest, NameWithoutExtension) {
    fs::path dir = makeTempDir("peerdrop_reserve_");
    writeFile(dir / "README", "x");

    fs::path path = transfer::reserve_destination(dir, "README");
    EXPECT_TRUE(path.extension().empty());
    EXPECT_EQ(path.filename().string().rfind("README_", 0), 0u);
    fs::remove_all(dir);
}

// -----------------------
// CATALOGUE
// -----------------------
TEST(FileCatalogueTest, KeepsArrivalOrderAndFindsById) {
    transfer::FileCatalogue catalogue;
    catalogue.add({"00000001", "b.txt", 1, "/tmp/b.txt", "2024-01-01T00:00:00"});
    catalogue.add({"00000002", "a.txt", 2, "/tmp/a.txt", "2024-01-01T00:00:01"});

    auto files = catalogue.list();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "b.txt");
    EXPECT_EQ(files[1].name, "a.txt");

    auto found = catalogue.find("00000002");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->size, 2u);
    EXPECT_FALSE(catalogue.find("ffffffff").has_value());
    EXPECT_EQ(catalogue.size(), 2u);
}

TEST(FileCatalogueTest, RecordSerializesToJson) {
    protocol::ReceivedFile file{"0a0b0c0d", "x.bin", 42, "/in/x.bin", "2024-05-06T07:08:09"};
    nlohmann::json j = file;
    EXPECT_EQ(j["id"], "0a0b0c0d");
    EXPECT_EQ(j["size"], 42);

    auto back = j.get<protocol::ReceivedFile>();
    EXPECT_EQ(back.path, "/in/x.bin");
}

TEST(MimeTest, GuessesFromExtension) {
    EXPECT_EQ(protocol::guess_content_type("a.txt"), "text/plain");
    EXPECT_EQ(protocol::guess_content_type("IMG_0001.JPG"), "image/jpeg");
    EXPECT_EQ(protocol::guess_content_type("/x/y/archive.zip"), "application/zip");
    EXPECT_EQ(protocol::guess_content_type("noext"), "application/octet-stream");
    EXPECT_EQ(protocol::guess_content_type("weird.qqq"), "application/octet-stream");
}

// -----------------------
// SENDING
// -----------------------
class FileSenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = makeTempDir("peerdrop_send_");
        inbox = root / "inbox";
        fs::create_directories(inbox);
        outbox = root / "outbox";
        fs::create_directories(outbox);
    }

    void TearDown() override {
        if (receiver) receiver->stop();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void startReceiver(unsigned short port, fs::path dir) {
        transfer::ReceiverOptions options;
        options.port = port;
        options.bind_address = "127.0.0.1";
        receiver = std::make_unique<transfer::FileReceiver>(
            options,
            [dir]() { return dir; },
            [this](const protocol::ReceivedFile& file) {
                std::lock_guard<std::mutex> lock(mutex);
                received.push_back(file);
            });
        receiver->start();
    }

    fs::path root;
    fs::path inbox;
    fs::path outbox;
    std::mutex mutex;
    std::vector<protocol::ReceivedFile> received;
    std::unique_ptr<transfer::FileReceiver> receiver;
};

TEST_F(FileSenderTest, DeliversFileEndToEnd) {
    startReceiver(9100, inbox);
    fs::path source = outbox / "ten.txt";
    writeFile(source, "0123456789");

    EXPECT_TRUE(transfer::FileSender::send(localDevice(9100), source.string()));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].name, "ten.txt");
    EXPECT_EQ(received[0].size, 10u);
    EXPECT_EQ(readFile(received[0].path), "0123456789");
}

TEST_F(FileSenderTest, DeliversBinaryContent) {
    startReceiver(0, inbox);
    std::string content;
    for (int i = 0; i < 200000; ++i) content += static_cast<char>((i * 7) % 256);
    fs::path source = outbox / "blob.bin";
    writeFile(source, content);

    ASSERT_TRUE(transfer::FileSender::send(localDevice(receiver->port()), source.string()));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(readFile(received[0].path), content);
}

TEST_F(FileSenderTest, RefusedConnectionReturnsFalse) {
    unsigned short port;
    {
        boost::asio::io_context io_context;
        tcp::acceptor placeholder(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = placeholder.local_endpoint().port();
    }
    fs::path source = outbox / "a.txt";
    writeFile(source, "a");

    EXPECT_FALSE(transfer::FileSender::send(localDevice(port), source.string()));
}

TEST_F(FileSenderTest, MissingFileReturnsFalse) {
    startReceiver(0, inbox);
    EXPECT_FALSE(transfer::FileSender::send(localDevice(receiver->port()),
                                            (outbox / "does-not-exist.txt").string()));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_TRUE(received.empty());
}

TEST_F(FileSenderTest, ServerErrorReturnsFalse) {
    // A regular file where the save directory should be makes every upload fail
    fs::path blocker = root / "blocker";
    writeFile(blocker, "not a directory");
    startReceiver(0, blocker / "inbox");

    fs::path source = outbox / "a.txt";
    writeFile(source, "a");
    EXPECT_FALSE(transfer::FileSender::send(localDevice(receiver->port()), source.string()));
}

TEST_F(FileSenderTest, UnresponsivePeerTimesOut) {
    // Accepts the connection but never answers
    boost::asio::io_context io_context;
    tcp::acceptor silent(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    fs::path source = outbox / "a.txt";
    writeFile(source, "a");

    transfer::SendOptions options;
    options.timeout = std::chrono::milliseconds(300);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(transfer::FileSender::send(localDevice(silent.local_endpoint().port()),
                                            source.string(), options));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
