/**************************************************************************
*   Copyright (C) 2026 by Eugene V. Lyubimkin                             *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#include <cctype>
#include <cstdlib>
#include <algorithm>

#include <gcrypt.h>

#include <common/regex.hpp>

#include <bulkfetch/config.hpp>

#include <internal/common.hpp>

#include <downloadmethods/signer.hpp>

namespace bulkfetch {
namespace s3 {

namespace {

void initGcrypt()
{
	static bool initialized = false;
	if (!initialized)
	{
		gcry_check_version(NULL);
		gcry_control (GCRYCTL_DISABLE_SECMEM, 0);
		gcry_control (GCRYCTL_INITIALIZATION_FINISHED, 0);
		initialized = true;
	}
}

string toHex(const string& binary)
{
	static const char fourBitToHex[] = "0123456789abcdef";
	string result;
	result.reserve(binary.size() * 2);
	for (unsigned char c: binary)
	{
		result += fourBitToHex[c >> 4];
		result += fourBitToHex[c & 0xf];
	}
	return result;
}

class GcryptHasher
{
	gcry_md_hd_t __gcrypt_handle;
	size_t __digest_size;
 public:
	// with a key, computes HMAC
	explicit GcryptHasher(const string* hmacKey = NULL)
	{
		initGcrypt();
		gcry_error_t gcryptError;
		if ((gcryptError = gcry_md_open(&__gcrypt_handle, GCRY_MD_SHA256, hmacKey ? GCRY_MD_FLAG_HMAC : 0)))
		{
			fatal2(__("unable to open a gcrypt hash handle: %s"), gcry_strerror(gcryptError));
		}
		if (hmacKey)
		{
			if ((gcryptError = gcry_md_setkey(__gcrypt_handle, hmacKey->data(), hmacKey->size())))
			{
				gcry_md_close(__gcrypt_handle);
				fatal2(__("unable to set a gcrypt HMAC key: %s"), gcry_strerror(gcryptError));
			}
		}
		__digest_size = gcry_md_get_algo_dlen(GCRY_MD_SHA256);
	}
	void process(const string& data)
	{
		gcry_md_write(__gcrypt_handle, data.data(), data.size());
	}
	string getResult() const
	{
		auto binaryResult = gcry_md_read(__gcrypt_handle, 0);
		return string(reinterpret_cast< const char* >(binaryResult), __digest_size);
	}
	~GcryptHasher()
	{
		gcry_md_close(__gcrypt_handle);
	}
};

string hmac(const string& key, const string& data)
{
	GcryptHasher hasher(&key);
	hasher.process(data);
	return hasher.getResult();
}

string formatUtcTime(time_t timestamp, const char* format)
{
	struct tm brokenDown;
	gmtime_r(&timestamp, &brokenDown);
	char buffer[32];
	strftime(buffer, sizeof(buffer), format, &brokenDown);
	return buffer;
}

string getEnvironment(const char* name)
{
	auto value = getenv(name);
	return value ? value : "";
}

}

bool Credentials::empty() const
{
	return accessKey.empty() || secretKey.empty();
}

Credentials Credentials::fromConfig(const Config& config)
{
	Credentials result;
	result.accessKey = config.getString("s3::access-key");
	result.secretKey = config.getString("s3::secret-key");
	result.sessionToken = config.getString("s3::session-token");
	if (result.accessKey.empty())
	{
		result.accessKey = getEnvironment("AWS_ACCESS_KEY_ID");
		result.secretKey = getEnvironment("AWS_SECRET_ACCESS_KEY");
		result.sessionToken = getEnvironment("AWS_SESSION_TOKEN");
	}
	return result;
}

string uriEncode(const string& input, bool encodeSlash)
{
	static const char hexDigits[] = "0123456789ABCDEF";
	string result;
	result.reserve(input.size());
	for (unsigned char c: input)
	{
		if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash))
		{
			result += c;
		}
		else
		{
			result += '%';
			result += hexDigits[c >> 4];
			result += hexDigits[c & 0xf];
		}
	}
	return result;
}

string sha256Hex(const string& data)
{
	GcryptHasher hasher;
	hasher.process(data);
	return toHex(hasher.getResult());
}

string buildQuery(const std::map< string, string >& parameters)
{
	vector< string > parts;
	for (const auto& parameter: parameters)
	{
		parts.push_back(uriEncode(parameter.first, true) + '=' + uriEncode(parameter.second, true));
	}
	return join("&", parts);
}

string Address::getBucketPath() const
{
	return basePath.empty() ? string("/") : basePath;
}

string Address::getObjectPath(const string& key) const
{
	return basePath + '/' + uriEncode(key, false);
}

string Address::getUrl(const string& path, const string& query) const
{
	string result = scheme + "://" + host + path;
	if (!query.empty())
	{
		result += '?';
		result += query;
	}
	return result;
}

Address Address::forBucket(const Config& config, const string& bucket)
{
	Address result;
	auto endpoint = config.getString("s3::endpoint");
	if (endpoint.empty())
	{
		result.scheme = "https";
		result.host = format2("%s.s3.%s.amazonaws.com", bucket, config.getString("s3::region"));
		return result;
	}

	static const sregex endpointRegex = sregex::compile("^(https?)://([^/]+)(.*?)/*$");
	smatch m;
	if (!regex_match(endpoint, m, endpointRegex))
	{
		fatal2(__("the endpoint '%s' is not an http(s) URL"), endpoint);
	}
	result.scheme = m[1];
	result.host = m[2];
	result.basePath = string(m[3]) + '/' + uriEncode(bucket, true);
	return result;
}

Signer::Signer(const Credentials& credentials, const string& region)
	: __credentials(credentials), __region(region)
{}

Signer::Headers Signer::sign(const string& method, const string& host, const string& path,
		const string& query, const Headers& headers, time_t now) const
{
	static const string emptyPayloadHash = sha256Hex("");
	auto amzDate = formatUtcTime(now, "%Y%m%dT%H%M%SZ");
	auto dateStamp = amzDate.substr(0, 8);

	Headers result;
	result.push_back({ "x-amz-content-sha256", emptyPayloadHash });
	result.push_back({ "x-amz-date", amzDate });
	if (!__credentials.sessionToken.empty())
	{
		result.push_back({ "x-amz-security-token", __credentials.sessionToken });
	}

	Headers signedHeaders = result;
	signedHeaders.push_back({ "host", host });
	for (const auto& header: headers)
	{
		signedHeaders.push_back({ internal::toLower(header.first), internal::trim(header.second) });
	}
	std::sort(signedHeaders.begin(), signedHeaders.end());

	string canonicalHeaders;
	vector< string > signedHeaderNames;
	for (const auto& header: signedHeaders)
	{
		canonicalHeaders += header.first + ':' + header.second + '\n';
		signedHeaderNames.push_back(header.first);
	}
	auto signedHeaderList = join(";", signedHeaderNames);

	auto canonicalRequest = method + '\n' + path + '\n' + query + '\n' +
			canonicalHeaders + '\n' + signedHeaderList + '\n' + emptyPayloadHash;
	auto scope = dateStamp + '/' + __region + "/s3/aws4_request";
	auto stringToSign = string("AWS4-HMAC-SHA256\n") + amzDate + '\n' + scope + '\n' +
			sha256Hex(canonicalRequest);

	auto signingKey = hmac(hmac(hmac(hmac("AWS4" + __credentials.secretKey, dateStamp),
			__region), "s3"), "aws4_request");
	auto signature = toHex(hmac(signingKey, stringToSign));

	result.push_back({ "Authorization", format2("AWS4-HMAC-SHA256 Credential=%s/%s, SignedHeaders=%s, Signature=%s",
			__credentials.accessKey, scope, signedHeaderList, signature) });
	return result;
}

}
}
