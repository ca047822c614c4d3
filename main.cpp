//
// Created by aowei on 2025/10/14.
//

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <fsm/dfsm.hpp>

std::string read_file_to_string(const std::string &filename) {
    // 以二进制模式打开（避免文本模式下的换行符转换）
    std::ifstream file(filename, std::ios::binary);

    // 检查文件是否成功打开
    if (!file.is_open()) {
        throw std::runtime_error("无法打开文件: " + filename + "（可能文件不存在或权限不足）");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // 检查读取过程是否出现错误
    if (file.fail() && !file.eof()) {
        throw std::runtime_error("读取文件失败: " + filename);
    }
    std::string content = buffer.str();
    // 编码只占一行，去掉结尾换行
    while (!content.empty() && (content.back() == '\n' || content.back() == '\r')) content.pop_back();
    return content;
}

// 用法：fsm_demo [编码文件 [输入串 ...]]
int main(int argc, char **argv) {
    std::string encoding = "0 1/a b/0 , a , 0; 0,b, 1 ;1, a, 0 ; 1, b, 1/0/ 1";
    std::vector<std::string> inputs = {"aab", "bba"};
    try {
        if (argc > 1) {
            encoding = read_file_to_string(argv[1]);
        }
        if (argc > 2) {
            inputs.assign(argv + 2, argv + argc);
        }

        const fsm::DFSM machine(encoding);
        machine.print("Input DFSM");
        for (const auto &input: inputs) {
            std::cout << input << ": " << std::boolalpha << machine.compute(input) << std::endl;
        }
        std::cout << "Minimized: " << machine.minimize().encode() << std::endl;
        std::cout << "Canonic:   " << machine.minimize().to_canonic_form().encode() << std::endl;
    } catch (const fsm::FsmError &e) {
        std::cerr << fsm::error_type_to_string(e.type()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
