#include <gtest/gtest.h>

#include "line_transport.hpp"
#include "json_codec.hpp"

#include <sstream>
#include <thread>
#include <vector>

using namespace taskbridge;

TEST(LineTransport, ReadsFramesAndStripsCarriageReturn) {
    std::istringstream in("{\"a\":1}\r\n{\"b\":2}\n");
    std::string line;

    EXPECT_EQ(transport::read_frame(in, line), transport::FrameStatus::Ok);
    EXPECT_EQ(line, "{\"a\":1}");
    EXPECT_EQ(transport::read_frame(in, line), transport::FrameStatus::Ok);
    EXPECT_EQ(line, "{\"b\":2}");
    EXPECT_EQ(transport::read_frame(in, line), transport::FrameStatus::Eof);
}

TEST(LineTransport, OversizedFrameIsDroppedAndReadingContinues) {
    std::string big(64, 'x');
    std::istringstream in(big + "\nsmall\n");
    std::string line;

    EXPECT_EQ(transport::read_frame(in, line, 16), transport::FrameStatus::TooLong);
    EXPECT_EQ(transport::read_frame(in, line, 16), transport::FrameStatus::Ok);
    EXPECT_EQ(line, "small");
}

TEST(LineTransport, OversizedFrameIsNotBufferedWhole) {
    std::istringstream in(std::string(1024 * 1024, 'x') + "\nnext\n");
    std::string line;

    EXPECT_EQ(transport::read_frame(in, line, 16), transport::FrameStatus::TooLong);
    EXPECT_LT(line.capacity(), 1024u);
    EXPECT_EQ(transport::read_frame(in, line, 16), transport::FrameStatus::Ok);
    EXPECT_EQ(line, "next");
}

TEST(LineTransport, FrameAtTheLimitIsAccepted) {
    std::istringstream in(std::string(16, 'y') + "\r\n" + std::string(17, 'z') + "\n");
    std::string line;

    EXPECT_EQ(transport::read_frame(in, line, 16), transport::FrameStatus::Ok);
    EXPECT_EQ(line, std::string(16, 'y'));
    EXPECT_EQ(transport::read_frame(in, line, 16), transport::FrameStatus::TooLong);
    EXPECT_EQ(transport::read_frame(in, line, 16), transport::FrameStatus::Eof);
}

TEST(LineTransport, ConcurrentWritersNeverInterleaveFrames) {
    std::ostringstream out;
    transport::FrameWriter writer(out);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&writer, t] {
            for (int i = 0; i < 200; ++i) {
                writer.write(Notification{"$event", json{{"thread", t}, {"seq", i}, {"pad", std::string(100, 'p')}}});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::istringstream in(out.str());
    std::string line;
    int frames = 0;
    while (std::getline(in, line)) {
        EXPECT_NO_THROW(codec::decode(line));
        ++frames;
    }
    EXPECT_EQ(frames, 800);
    EXPECT_TRUE(writer.healthy());
}

TEST(LineTransport, BrokenStreamMarksWriterUnhealthy) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    transport::FrameWriter writer(out);

    EXPECT_FALSE(writer.write_line("{}"));
    EXPECT_FALSE(writer.healthy());
}
