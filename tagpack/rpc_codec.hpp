#pragma once

#include "tagpack/decoder.hpp"
#include "tagpack/encoder.hpp"
#include "tagpack/errors.hpp"
#include "tagpack/logger.hpp"
#include "tagpack/traits.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>

namespace tagpack
{
	// Envelope written before every request and response body.
	struct Header
	{
		std::string service_method;
		uint64_t sequence=0;
		std::string error; // empty when the call succeeded

		static constexpr auto fields()
		{
			return std::make_tuple(
				field("ServiceMethod",&Header::service_method),
				field("Seq",&Header::sequence),
				field("Error",&Header::error));
		}

		bool operator==(const Header &rhs) const=default;
	};

	/* Connection
	 *
	 * A bidirectional byte connection. close() must make any read or write in
	 * progress on the streams fail instead of blocking.
	 */
	class Connection
	{
	public:
		virtual ~Connection()=default;
		virtual std::istream& input()=0;
		virtual std::ostream& output()=0;
		virtual void close() noexcept=0;
	};

	// Connection over caller owned streams. Closing puts both streams in the
	// bad state.
	class StreamConnection : public Connection
	{
	public:
		explicit StreamConnection(std::iostream &stream);
		StreamConnection(std::istream &input,std::ostream &output);

		std::istream& input() override { return m_input; }
		std::ostream& output() override { return m_output; }
		void close() noexcept override;

	private:
		std::istream &m_input;
		std::ostream &m_output;
	};

	/* RpcCodec
	 *
	 * Frames request/response messages as a header value followed by a body
	 * value on one connection. Messages are strictly FIFO; pairing responses
	 * to requests by Header::sequence is left to the caller.
	 *
	 * Any codec or stream failure leaves the byte stream at an unknown offset,
	 * so the codec refuses further use with RpcError and the connection must be
	 * discarded.
	 */
	class RpcCodec
	{
	public:
		explicit RpcCodec(std::unique_ptr<Connection> connection,EncodeOptions encode_options={},DecodeOptions decode_options={});
		~RpcCodec();

		RpcCodec(const RpcCodec&)=delete;
		RpcCodec& operator=(const RpcCodec&)=delete;

		// Client role

		template<typename Body>
		void write_request(const Header &header,const Body &body)
		{
			write_message("request",header,body);
		}

		// Returns false on a clean end of stream before the next header.
		bool read_response_header(Header &header);

		template<typename Body>
		void read_response_body(Body *body)
		{
			read_body("response",body);
		}
		void read_response_body(std::nullptr_t);

		// Server role

		bool read_request_header(Header &header);

		template<typename Body>
		void read_request_body(Body *body)
		{
			read_body("request",body);
		}
		void read_request_body(std::nullptr_t);

		template<typename Body>
		void write_response(const Header &header,const Body &body)
		{
			write_message("response",header,body);
		}

		// Releases the connection. Later calls are no-ops.
		void close();
		bool is_closed() const { return m_closed; }

	private:
		static Connection& checked(const std::unique_ptr<Connection> &connection);

		void check_usable(const char *operation) const;
		bool read_header(const char *role,Header &header);
		void skip_body(const char *role);

		// Runs one exchange step, marking the codec broken if it throws.
		template<typename F>
		void exchange(const char *role,const char *step,F &&body)
		{
			check_usable(step);
			try
			{
				body();
			}
			catch(const std::exception &e)
			{
				m_broken=true;
				TAGPACK_LOG_WARN(std::string("rpc: ")+step+" "+role+" failed: "+e.what());
				throw;
			}
		}

		template<typename Body>
		void write_message(const char *role,const Header &header,const Body &body)
		{
			exchange(role,"write",[&]
			{
				m_encoder.encode(header);
				m_encoder.encode(body);
				m_encoder.flush();
			});
			TAGPACK_LOG_DEBUG("rpc: wrote "+std::string(role)+" "+header.service_method+" seq "+std::to_string(header.sequence));
		}

		template<typename Body>
		void read_body(const char *role,Body *body)
		{
			if(!body)
			{
				skip_body(role);
				return;
			}
			exchange(role,"read body of",[&]
			{
				m_decoder.decode(*body);
			});
		}

		std::unique_ptr<Connection> m_connection;
		Encoder m_encoder;
		Decoder m_decoder;
		bool m_closed=false;
		bool m_broken=false;
	};

} // namespace tagpack
