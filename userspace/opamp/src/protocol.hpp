/**
 * @file
 *
 * Implementation of the protocol decoding templates.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */

template<class T>
void opamp::protocol::buffer_to_protobuf(const uint8_t* const buf,
                                         const uint32_t size,
                                         T* const message,
                                         compression_method compression)
{
	google::protobuf::io::ArrayInputStream stream(buf, size);
	bool ret;

	if (compression == compression_method::GZIP)
	{
		google::protobuf::io::GzipInputStream gzstream(&stream);
		google::protobuf::io::CodedInputStream coded(&gzstream);
		coded.SetTotalBytesLimit(MAX_MESSAGE_SIZE);
		ret = message->ParseFromCodedStream(&coded);
	}
	else
	{
		ret = message->ParseFromZeroCopyStream(&stream);
	}

	if(!ret)
	{
		throw protocol_error("Failed to parse " + std::string(to_string(compression)) +
		                     " message to type: " + message->GetTypeName());
	}
}

template<class T>
void opamp::protocol::frame_to_protobuf(const wire_frame& frame, T* const message)
{
	const uint8_t* const buf = reinterpret_cast<const uint8_t*>(frame.payload.data());
	buffer_to_protobuf(buf,
	                   static_cast<uint32_t>(frame.payload.size()),
	                   message,
	                   frame.encoding);
}
