#include "open62541_client.hpp"
#include <open62541/client.h>
#include <open62541/client_config_default.h>
#include <open62541/client_highlevel.h>
#include <algorithm>
#include <cstdint>
#include <iostream>

namespace opcualogger {

namespace {

std::string toStdString(const UA_String& s) {
    if (!s.data || s.length == 0) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(s.data), s.length);
}

std::string statusName(UA_StatusCode status) {
    return UA_StatusCode_name(status);
}

} // anonymous namespace

std::string engineeringUnitText(const UA_Variant& value) {
    if (!UA_Variant_hasScalarType(&value, &UA_TYPES[UA_TYPES_EUINFORMATION])) {
        return {};
    }
    const auto* info = static_cast<const UA_EUInformation*>(value.data);
    return toStdString(info->displayName.text);
}

ErrorSeverity classifyStatus(UA_StatusCode status) {
    switch (status) {
        // 认证 / 安全配置
        case UA_STATUSCODE_BADUSERACCESSDENIED:
        case UA_STATUSCODE_BADIDENTITYTOKENINVALID:
        case UA_STATUSCODE_BADIDENTITYTOKENREJECTED:
        case UA_STATUSCODE_BADUSERSIGNATUREINVALID:
        case UA_STATUSCODE_BADAPPLICATIONSIGNATUREINVALID:
        case UA_STATUSCODE_BADCERTIFICATEINVALID:
        case UA_STATUSCODE_BADCERTIFICATEUNTRUSTED:
        case UA_STATUSCODE_BADSECURITYMODEREJECTED:
        case UA_STATUSCODE_BADSECURITYPOLICYREJECTED:
        case UA_STATUSCODE_BADTCPENDPOINTURLINVALID:
        // 节点 / 属性
        case UA_STATUSCODE_BADNODEIDUNKNOWN:
        case UA_STATUSCODE_BADNODEIDINVALID:
        case UA_STATUSCODE_BADATTRIBUTEIDINVALID:
        case UA_STATUSCODE_BADNOTREADABLE:
        case UA_STATUSCODE_BADTYPEMISMATCH:
        case UA_STATUSCODE_BADINDEXRANGEINVALID:
        case UA_STATUSCODE_BADDATAENCODINGUNSUPPORTED:
        case UA_STATUSCODE_BADREFERENCETYPEIDINVALID:
        case UA_STATUSCODE_BADBROWSEDIRECTIONINVALID:
        case UA_STATUSCODE_BADNODENOTINVIEW:
            return ErrorSeverity::Fatal;
        default:
            return ErrorSeverity::Transient;
    }
}

Open62541Client::Open62541Client(std::chrono::milliseconds request_timeout)
    : request_timeout_ms_(static_cast<uint32_t>(std::clamp<int64_t>(request_timeout.count(), 1, UINT32_MAX)))
    , connected_(false) {
}

Open62541Client::~Open62541Client() {
    close();
}

void Open62541Client::connect(const Endpoint& endpoint) {
    close();

    client_ = std::make_unique<opcua::Client>();

    UA_ClientConfig* config = UA_Client_getConfig(client_->handle());
    config->timeout = request_timeout_ms_;
    if (endpoint.security_mode == "Sign") {
        config->securityMode = UA_MESSAGESECURITYMODE_SIGN;
    } else if (endpoint.security_mode == "SignAndEncrypt") {
        config->securityMode = UA_MESSAGESECURITYMODE_SIGNANDENCRYPT;
    } else {
        config->securityMode = UA_MESSAGESECURITYMODE_NONE;
    }

    if (!endpoint.username.empty()) {
        UA_StatusCode status = UA_ClientConfig_setAuthenticationUsername(
            config, endpoint.username.c_str(), endpoint.password.c_str());
        if (status != UA_STATUSCODE_GOOD) {
            throw ConnectError(ErrorSeverity::Fatal,
                               "Cannot set user identity for " + endpoint.url + ": " + statusName(status));
        }
    }

    try {
        client_->connect(endpoint.url);
        connected_ = true;
    } catch (const opcua::BadStatus& e) {
        client_.reset();
        throw ConnectError(classifyStatus(e.code()),
                           "Failed to connect to " + endpoint.url + ": " + e.what());
    } catch (const std::exception& e) {
        client_.reset();
        throw ConnectError(ErrorSeverity::Transient,
                           "Failed to connect to " + endpoint.url + ": " + e.what());
    }
}

RemoteValue Open62541Client::readValue(const DataPointId& id) {
    if (!client_ || !connected_) {
        throw ReadError(ErrorSeverity::Transient, "Session is not connected");
    }

    opcua::NodeId node_id = toNodeId(id);
    opcua::Variant variant;
    try {
        opcua::Node<opcua::Client> node(*client_, node_id);
        variant = node.readValue();
    } catch (const opcua::BadStatus& e) {
        throw ReadError(classifyStatus(e.code()), "Read " + id.toString() + " failed: " + e.what());
    }

    RemoteValue result;
    result.value = toNumber(variant, id);
    result.unit = lookupUnit(id, node_id);
    return result;
}

std::string Open62541Client::lookupUnit(const DataPointId& id, const opcua::NodeId& node_id) {
    const std::string key = id.toString();
    auto cached = units_.find(key);
    if (cached != units_.end()) {
        return cached->second;
    }

    // 节点 --HasProperty--> EngineeringUnits
    UA_RelativePathElement element;
    UA_RelativePathElement_init(&element);
    element.referenceTypeId = UA_NODEID_NUMERIC(0, UA_NS0ID_HASPROPERTY);
    element.isInverse = false;
    element.includeSubtypes = false;
    element.targetName = UA_QUALIFIEDNAME(0, const_cast<char*>("EngineeringUnits"));

    UA_BrowsePath path;
    UA_BrowsePath_init(&path);
    path.startingNode = *node_id.handle();
    path.relativePath.elements = &element;
    path.relativePath.elementsSize = 1;

    UA_TranslateBrowsePathsToNodeIdsRequest request;
    UA_TranslateBrowsePathsToNodeIdsRequest_init(&request);
    request.browsePaths = &path;
    request.browsePathsSize = 1;

    UA_TranslateBrowsePathsToNodeIdsResponse response =
        UA_Client_Service_translateBrowsePathsToNodeIds(client_->handle(), request);
    UA_StatusCode status = response.responseHeader.serviceResult;
    if (status == UA_STATUSCODE_GOOD && response.resultsSize != 1) {
        status = UA_STATUSCODE_BADUNEXPECTEDERROR;
    }
    if (status == UA_STATUSCODE_GOOD) {
        status = response.results[0].statusCode;
    }

    std::string unit;
    if (status == UA_STATUSCODE_GOOD && response.results[0].targetsSize > 0) {
        UA_Variant value;
        UA_Variant_init(&value);
        status = UA_Client_readValueAttribute(client_->handle(),
                                              response.results[0].targets[0].targetId.nodeId, &value);
        try {
            if (status == UA_STATUSCODE_GOOD) {
                unit = engineeringUnitText(value);
            }
        } catch (const std::exception&) {
            UA_Variant_clear(&value);
            UA_TranslateBrowsePathsToNodeIdsResponse_clear(&response);
            throw;
        }
        UA_Variant_clear(&value);
    }
    UA_TranslateBrowsePathsToNodeIdsResponse_clear(&response);

    // 没有该属性时缓存空单位，其余错误下次读取时重试
    if (status == UA_STATUSCODE_GOOD || status == UA_STATUSCODE_BADNOMATCH) {
        units_[key] = unit;
    } else {
        std::cerr << "Cannot read EngineeringUnits of " << key << ": " << statusName(status) << std::endl;
    }
    return unit;
}

std::vector<RemoteReference> Open62541Client::browseChildren(const DataPointId& id) {
    if (!client_ || !connected_) {
        throw BrowseError(ErrorSeverity::Transient, "Session is not connected");
    }

    opcua::NodeId node_id = toNodeId(id);

    UA_BrowseDescription description;
    UA_BrowseDescription_init(&description);
    description.nodeId = *node_id.handle();
    description.referenceTypeId = UA_NODEID_NUMERIC(0, UA_NS0ID_HIERARCHICALREFERENCES);
    description.includeSubtypes = true;
    description.browseDirection = UA_BROWSEDIRECTION_FORWARD;
    description.resultMask = UA_BROWSERESULTMASK_ALL;

    UA_BrowseRequest request;
    UA_BrowseRequest_init(&request);
    request.nodesToBrowse = &description;
    request.nodesToBrowseSize = 1;
    request.requestedMaxReferencesPerNode = 0;

    UA_BrowseResponse response = UA_Client_Service_browse(client_->handle(), request);
    UA_StatusCode status = response.responseHeader.serviceResult;
    if (status == UA_STATUSCODE_GOOD && response.resultsSize != 1) {
        status = UA_STATUSCODE_BADUNEXPECTEDERROR;
    }
    if (status == UA_STATUSCODE_GOOD) {
        status = response.results[0].statusCode;
    }
    if (status != UA_STATUSCODE_GOOD) {
        UA_BrowseResponse_clear(&response);
        throw BrowseError(classifyStatus(status), "Browse " + id.toString() + " failed: " + statusName(status));
    }

    UA_ByteString continuation;
    UA_ByteString_init(&continuation);
    status = UA_ByteString_copy(&response.results[0].continuationPoint, &continuation);
    if (status != UA_STATUSCODE_GOOD) {
        UA_BrowseResponse_clear(&response);
        throw BrowseError(ErrorSeverity::Transient, "Browse " + id.toString() + " failed: " + statusName(status));
    }

    // 转换失败时释放应答并归还服务器端的续传点
    std::vector<RemoteReference> children;
    try {
        collectReferences(response.results[0], children);
    } catch (const std::exception&) {
        UA_BrowseResponse_clear(&response);
        releaseContinuationPoint(continuation);
        throw;
    }
    UA_BrowseResponse_clear(&response);

    // 服务器分批返回时用 BrowseNext 取完剩余引用
    while (continuation.length > 0) {
        UA_BrowseNextRequest next_request;
        UA_BrowseNextRequest_init(&next_request);
        next_request.continuationPoints = &continuation;
        next_request.continuationPointsSize = 1;

        UA_BrowseNextResponse next_response = UA_Client_Service_browseNext(client_->handle(), next_request);
        UA_ByteString_clear(&continuation);

        status = next_response.responseHeader.serviceResult;
        if (status == UA_STATUSCODE_GOOD && next_response.resultsSize != 1) {
            status = UA_STATUSCODE_BADUNEXPECTEDERROR;
        }
        if (status == UA_STATUSCODE_GOOD) {
            status = next_response.results[0].statusCode;
        }
        if (status != UA_STATUSCODE_GOOD) {
            UA_BrowseNextResponse_clear(&next_response);
            throw BrowseError(classifyStatus(status), "BrowseNext " + id.toString() + " failed: " + statusName(status));
        }

        status = UA_ByteString_copy(&next_response.results[0].continuationPoint, &continuation);
        if (status != UA_STATUSCODE_GOOD) {
            UA_BrowseNextResponse_clear(&next_response);
            throw BrowseError(ErrorSeverity::Transient, "BrowseNext " + id.toString() + " failed: " + statusName(status));
        }

        try {
            collectReferences(next_response.results[0], children);
        } catch (const std::exception&) {
            UA_BrowseNextResponse_clear(&next_response);
            releaseContinuationPoint(continuation);
            throw;
        }
        UA_BrowseNextResponse_clear(&next_response);
    }

    return children;
}

void Open62541Client::releaseContinuationPoint(UA_ByteString& continuation) {
    if (continuation.length > 0 && client_) {
        UA_BrowseNextRequest request;
        UA_BrowseNextRequest_init(&request);
        request.releaseContinuationPoints = true;
        request.continuationPoints = &continuation;
        request.continuationPointsSize = 1;

        UA_BrowseNextResponse response = UA_Client_Service_browseNext(client_->handle(), request);
        if (response.responseHeader.serviceResult != UA_STATUSCODE_GOOD) {
            std::cerr << "Cannot release browse continuation point: "
                      << statusName(response.responseHeader.serviceResult) << std::endl;
        }
        UA_BrowseNextResponse_clear(&response);
    }
    UA_ByteString_clear(&continuation);
}

void Open62541Client::close() {
    units_.clear();
    if (!client_) {
        return;
    }

    try {
        if (connected_) {
            client_->disconnect();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error during disconnect: " << e.what() << std::endl;
    }

    connected_ = false;
    client_.reset();
}

bool Open62541Client::isAlive() const {
    if (!client_ || !connected_) {
        return false;
    }

    UA_SecureChannelState channel_state;
    UA_SessionState session_state;
    UA_StatusCode connect_status;
    UA_Client_getState(client_->handle(), &channel_state, &session_state, &connect_status);

    return session_state == UA_SESSIONSTATE_ACTIVATED && connect_status == UA_STATUSCODE_GOOD;
}

opcua::NodeId Open62541Client::toNodeId(const DataPointId& id) {
    switch (id.type) {
        case IdentifierType::Numeric:
            return opcua::NodeId(id.namespace_index, id.numericValue());
        case IdentifierType::String:
            return opcua::NodeId(id.namespace_index, id.identifier);
        default:
            break;
    }

    // GUID / ByteString 标识保留的是服务器打印的文本形式
    opcua::NodeId node_id;
    UA_String text = UA_STRING(const_cast<char*>(id.identifier.c_str()));
    UA_StatusCode status = UA_NodeId_parse(node_id.handle(), text);
    if (status != UA_STATUSCODE_GOOD) {
        throw ReadError(ErrorSeverity::Fatal, "Cannot parse node id '" + id.identifier + "'");
    }
    return node_id;
}

DataPointId Open62541Client::fromNodeId(const UA_NodeId& id) {
    if (id.identifierType == UA_NODEIDTYPE_NUMERIC) {
        return DataPointId(id.namespaceIndex, static_cast<uint32_t>(id.identifier.numeric));
    }
    if (id.identifierType == UA_NODEIDTYPE_STRING) {
        return DataPointId(id.namespaceIndex, toStdString(id.identifier.string));
    }

    UA_String printed = UA_STRING_NULL;
    UA_StatusCode status = UA_NodeId_print(&id, &printed);
    if (status != UA_STATUSCODE_GOOD) {
        throw BrowseError(ErrorSeverity::Transient, std::string("Cannot print node id: ") + statusName(status));
    }

    DataPointId opaque;
    opaque.namespace_index = id.namespaceIndex;
    opaque.type = IdentifierType::Opaque;
    opaque.identifier = toStdString(printed);
    UA_String_clear(&printed);
    return opaque;
}

double Open62541Client::toNumber(const opcua::Variant& variant, const DataPointId& id) {
    if (!variant.isScalar()) {
        throw ReadError(ErrorSeverity::Fatal, "Value of " + id.toString() + " is not a scalar");
    }

    if (variant.isType<double>()) {
        return variant.scalar<double>();
    } else if (variant.isType<float>()) {
        return static_cast<double>(variant.scalar<float>());
    } else if (variant.isType<int32_t>()) {
        return static_cast<double>(variant.scalar<int32_t>());
    } else if (variant.isType<uint32_t>()) {
        return static_cast<double>(variant.scalar<uint32_t>());
    } else if (variant.isType<int16_t>()) {
        return static_cast<double>(variant.scalar<int16_t>());
    } else if (variant.isType<uint16_t>()) {
        return static_cast<double>(variant.scalar<uint16_t>());
    } else if (variant.isType<int64_t>()) {
        return static_cast<double>(variant.scalar<int64_t>());
    } else if (variant.isType<uint64_t>()) {
        return static_cast<double>(variant.scalar<uint64_t>());
    } else if (variant.isType<int8_t>()) {
        return static_cast<double>(variant.scalar<int8_t>());
    } else if (variant.isType<uint8_t>()) {
        return static_cast<double>(variant.scalar<uint8_t>());
    } else if (variant.isType<bool>()) {
        return variant.scalar<bool>() ? 1.0 : 0.0;
    }

    throw ReadError(ErrorSeverity::Fatal, "Value of " + id.toString() + " has unsupported type");
}

void Open62541Client::collectReferences(const UA_BrowseResult& result, std::vector<RemoteReference>& out) {
    out.reserve(out.size() + result.referencesSize);
    for (size_t i = 0; i < result.referencesSize; ++i) {
        const UA_ReferenceDescription& reference = result.references[i];

        RemoteReference child;
        child.id = fromNodeId(reference.nodeId.nodeId);
        child.display_name = toStdString(reference.displayName.text);
        out.push_back(std::move(child));
    }
}

} // namespace opcualogger
