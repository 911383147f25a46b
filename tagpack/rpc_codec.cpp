#include "tagpack/rpc_codec.hpp"

namespace tagpack
{
	StreamConnection::StreamConnection(std::iostream &stream):
		m_input(stream),m_output(stream)
	{
	}

	StreamConnection::StreamConnection(std::istream &input,std::ostream &output):
		m_input(input),m_output(output)
	{
	}

	void StreamConnection::close() noexcept
	{
		m_input.setstate(std::ios::badbit);
		m_output.setstate(std::ios::badbit);
	}

	Connection& RpcCodec::checked(const std::unique_ptr<Connection> &connection)
	{
		if(!connection)
			throw RpcError("rpc: codec needs a connection");
		return *connection;
	}

	RpcCodec::RpcCodec(std::unique_ptr<Connection> connection,EncodeOptions encode_options,DecodeOptions decode_options):
		m_connection(std::move(connection)),
		m_encoder(checked(m_connection).output(),encode_options),
		m_decoder(checked(m_connection).input(),decode_options)
	{
	}

	RpcCodec::~RpcCodec()
	{
		close();
	}

	void RpcCodec::close()
	{
		if(m_closed)
			return;
		m_closed=true;
		m_connection->close();
		TAGPACK_LOG_DEBUG("rpc: connection closed");
	}

	void RpcCodec::check_usable(const char *operation) const
	{
		if(m_closed)
			throw RpcError(std::string("rpc: cannot ")+operation+" a closed connection");
		if(m_broken)
			throw RpcError(std::string("rpc: cannot ")+operation+" a connection after an earlier failure");
	}

	bool RpcCodec::read_header(const char *role,Header &header)
	{
		bool present=false;
		exchange(role,"read header of",[&]
		{
			if(m_decoder.at_end())
				return;
			header=Header{};
			m_decoder.decode(header);
			present=true;
		});
		if(present)
			TAGPACK_LOG_DEBUG("rpc: read "+std::string(role)+" "+header.service_method+" seq "+std::to_string(header.sequence));
		else
			TAGPACK_LOG_DEBUG("rpc: end of stream before "+std::string(role));
		return present;
	}

	void RpcCodec::skip_body(const char *role)
	{
		exchange(role,"discard body of",[&]
		{
			m_decoder.skip();
		});
	}

	bool RpcCodec::read_response_header(Header &header)
	{
		return read_header("response",header);
	}

	bool RpcCodec::read_request_header(Header &header)
	{
		return read_header("request",header);
	}

	void RpcCodec::read_response_body(std::nullptr_t)
	{
		skip_body("response");
	}

	void RpcCodec::read_request_body(std::nullptr_t)
	{
		skip_body("request");
	}

} // namespace tagpack
