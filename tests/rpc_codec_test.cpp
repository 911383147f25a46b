#include "fixtures.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace tagpack;
using tagpack::test::bytes;

namespace
{
	struct Args
	{
		int64_t a=0;
		int64_t b=0;

		static constexpr auto fields()
		{
			return std::make_tuple(field("A",&Args::a),field("B",&Args::b));
		}
	};

	// One stream per direction, as a socket pair would have.
	struct Pipe
	{
		std::stringstream requests;
		std::stringstream responses;

		std::unique_ptr<Connection> client_side()
		{
			return std::make_unique<StreamConnection>(responses,requests);
		}

		std::unique_ptr<Connection> server_side()
		{
			return std::make_unique<StreamConnection>(requests,responses);
		}
	};

	// Routes the process wide log to a test sink until destroyed.
	class CapturedLog
	{
	public:
		CapturedLog(LogLevel level,Logger::Sink sink):
			m_level(Logger::inst().level()),m_sink(Logger::inst().sink())
		{
			Logger::inst().set_sink(std::move(sink));
			Logger::inst().set_level(level);
		}

		~CapturedLog()
		{
			Logger::inst().set_level(m_level);
			Logger::inst().set_sink(std::move(m_sink));
		}

	private:
		LogLevel m_level;
		Logger::Sink m_sink;
	};

	class CountingConnection : public Connection
	{
	public:
		explicit CountingConnection(int &closes):m_closes(closes){}

		std::istream& input() override { return m_stream; }
		std::ostream& output() override { return m_stream; }
		void close() noexcept override { ++m_closes; }

	private:
		std::stringstream m_stream;
		int &m_closes;
	};
}

TEST(RpcCodecTest, RequestResponseExchange)
{
	Pipe pipe;
	RpcCodec client(pipe.client_side());
	RpcCodec server(pipe.server_side());

	client.write_request(Header{"Arith.Multiply",1,""},Args{6,7});

	Header request;
	ASSERT_TRUE(server.read_request_header(request));
	EXPECT_EQ(request, (Header{"Arith.Multiply",1,""}));
	Args args;
	server.read_request_body(&args);
	EXPECT_EQ(args.a, 6);
	EXPECT_EQ(args.b, 7);

	server.write_response(Header{request.service_method,request.sequence,""},args.a*args.b);

	Header response;
	ASSERT_TRUE(client.read_response_header(response));
	EXPECT_EQ(response.sequence, 1u);
	EXPECT_TRUE(response.error.empty());
	int64_t product=0;
	client.read_response_body(&product);
	EXPECT_EQ(product, 42);
}

TEST(RpcCodecTest, HeaderThenBodyOnTheWire)
{
	std::stringstream wire;
	RpcCodec client(std::make_unique<StreamConnection>(wire));
	client.write_request(Header{"S.M",2,""},true);
	EXPECT_EQ(wire.str(),
		bytes({0x83,
			0xad,'S','e','r','v','i','c','e','M','e','t','h','o','d',0xa3,'S','.','M',
			0xa3,'S','e','q',0x02,
			0xa5,'E','r','r','o','r',0xa0,
			0xc3}));
}

TEST(RpcCodecTest, MessagesAreFifo)
{
	Pipe pipe;
	RpcCodec client(pipe.client_side());
	RpcCodec server(pipe.server_side());

	for(uint64_t seq=1;seq<=3;seq++)
		client.write_request(Header{"Echo.Echo",seq,""},std::string("m")+std::to_string(seq));

	for(uint64_t seq=1;seq<=3;seq++)
	{
		Header header;
		ASSERT_TRUE(server.read_request_header(header));
		EXPECT_EQ(header.sequence, seq);
		std::string body;
		server.read_request_body(&body);
		EXPECT_EQ(body, "m"+std::to_string(seq));
	}
}

TEST(RpcCodecTest, ErrorResponseWithDiscardedBody)
{
	Pipe pipe;
	RpcCodec client(pipe.client_side());
	RpcCodec server(pipe.server_side());

	server.write_response(Header{"Arith.Divide",9,"divide by zero"},nullptr);
	server.write_response(Header{"Arith.Divide",10,""},std::vector<int32_t>{1,2,3});
	server.write_response(Header{"Arith.Divide",11,""},int32_t(5));

	Header header;
	ASSERT_TRUE(client.read_response_header(header));
	EXPECT_EQ(header.error, "divide by zero");
	client.read_response_body(nullptr);

	ASSERT_TRUE(client.read_response_header(header));
	EXPECT_EQ(header.sequence, 10u);
	EXPECT_TRUE(header.error.empty());
	client.read_response_body(static_cast<std::vector<int32_t>*>(nullptr));

	ASSERT_TRUE(client.read_response_header(header));
	int32_t body=0;
	client.read_response_body(&body);
	EXPECT_EQ(body, 5);
}

TEST(RpcCodecTest, CleanEndOfStream)
{
	Pipe pipe;
	RpcCodec client(pipe.client_side());
	RpcCodec server(pipe.server_side());

	client.write_request(Header{"S.M",1,""},nullptr);
	Header header;
	ASSERT_TRUE(server.read_request_header(header));
	server.read_request_body(nullptr);
	EXPECT_FALSE(server.read_request_header(header));
}

TEST(RpcCodecTest, CloseIsIdempotent)
{
	Pipe pipe;
	RpcCodec client(pipe.client_side());
	EXPECT_FALSE(client.is_closed());
	client.close();
	EXPECT_TRUE(client.is_closed());
	EXPECT_NO_THROW(client.close());

	EXPECT_TRUE(pipe.requests.bad());
	EXPECT_TRUE(pipe.responses.bad());
	EXPECT_THROW(client.write_request(Header{"S.M",1,""},nullptr), RpcError);
	Header header;
	EXPECT_THROW(client.read_response_header(header), RpcError);
}

TEST(RpcCodecTest, ClosedConnectionFailsPeerIo)
{
	Pipe pipe;
	RpcCodec client(pipe.client_side());
	RpcCodec server(pipe.server_side());
	client.close();

	Header header;
	EXPECT_THROW(server.read_request_header(header), DecodeError);
	EXPECT_THROW(server.read_request_header(header), RpcError);
}

TEST(RpcCodecTest, DestructorReleasesConnectionOnce)
{
	int closes=0;
	{
		RpcCodec codec(std::make_unique<CountingConnection>(closes));
	}
	EXPECT_EQ(closes, 1);

	closes=0;
	{
		RpcCodec codec(std::make_unique<CountingConnection>(closes));
		codec.close();
		codec.close();
	}
	EXPECT_EQ(closes, 1);
}

TEST(RpcCodecTest, FailureBreaksTheCodec)
{
	std::stringstream wire(bytes({0xc1}));
	RpcCodec server(std::make_unique<StreamConnection>(wire));

	Header header;
	try
	{
		server.read_request_header(header);
		FAIL()<<"read a malformed header";
	}
	catch(const DecodeError &e)
	{
		EXPECT_EQ(e.kind(), DecodeError::Kind::MALFORMED_TAG);
	}
	EXPECT_THROW(server.read_request_header(header), RpcError);
	EXPECT_THROW(server.write_response(Header{},nullptr), RpcError);
}

TEST(RpcCodecTest, MismatchedBodyBreaksTheCodec)
{
	Pipe pipe;
	RpcCodec client(pipe.client_side());
	RpcCodec server(pipe.server_side());

	client.write_request(Header{"S.M",1,""},std::string("not a number"));
	Header header;
	ASSERT_TRUE(server.read_request_header(header));
	int64_t body=0;
	EXPECT_THROW(server.read_request_body(&body), DecodeError);
	EXPECT_THROW(server.read_request_body(&body), RpcError);
}

TEST(RpcCodecTest, NullConnectionIsRejected)
{
	EXPECT_THROW(RpcCodec codec(nullptr), RpcError);
}

TEST(RpcCodecTest, ExchangesAreLoggedAtDebug)
{
	const LogLevel before=Logger::inst().level();
	auto lines=std::make_shared<std::vector<std::string>>();
	{
		CapturedLog capture(LogLevel::Debug,[lines](LogLevel,const std::string &msg){ lines->push_back(msg); });
		Pipe pipe;
		RpcCodec client(pipe.client_side());
		client.write_request(Header{"Arith.Add",3,""},nullptr);
	}

	EXPECT_EQ(Logger::inst().level(), before);
	EXPECT_EQ(lines.use_count(), 1) << "capturing sink still installed";
	ASSERT_GE(lines->size(), 2u);
	EXPECT_EQ(lines->front(), "rpc: wrote request Arith.Add seq 3");
	EXPECT_EQ(lines->back(), "rpc: connection closed");
}
