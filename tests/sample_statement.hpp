#pragma once

#include <string>

// Plain-text statement as emitted by the payroll system: three roles for two
// people plus one entry whose name line is missing.
inline std::string sampleStatement() {
  const std::string rule(110, '_');
  return
    "GOBIERNO DE LA PROVINCIA DE CORDOBA\n"
    "LIQUIDACION DE HABERES - MARZO 2024\n" + rule + "\n"
    "Id. Hr: 10001  Cargo: 120  Rol: 1  Dias Trab: 30  Fecha Alta: 01/03/2010\n"
    "Apellido y Nombre: PEREZ JUAN CARLOS       Centro Pago: 45\n"
    "DV 100 Sueldo Basico                         150.000,00\n"
    "DV 120 Complemento Remunerativo               12.345,67\n"
    "RT 300 Ajuste Dif. Aporte Minimo APROSS        1.500,00\n"
    "RT 310 Descuento APROSS por afiliados Familiares Voluntar  2.250,50\n"
    "Rem c/ Aporte 162.345,67    Rem s/ Aporte 1.626,61\n"
    "Liq. Pesos: 138.784,57\n" + rule + "\n"
    "Id. Hr: 10002  Cargo: 130  Rol: 2  Dias Trab: 15  Fecha Alta: 15/08/2015\n"
    "Apellido y Nombre: LOPEZ MARIA       Centro Pago: 45\n"
    "DV 100 Sueldo Basico                          80.000,00\n"
    "Rem c/ Aporte 80.000,00    Rem s/ Aporte 0,00\n"
    "Liq. Pesos: 65.000,00\n" + rule + "\n"
    "Id. Hr: 10001  Cargo: 121  Rol: 3  Dias Trab: 30  Fecha Alta: 01/03/2012\n"
    "Apellido y Nombre: Perez  Juan Carlos       Centro Pago: 46\n"
    "DV 100 Sueldo Basico                          50.000,00\n"
    "Rem c/ Aporte 50.000,00\n"
    "Liq. Pesos: 40.000,00\n" + rule + "\n"
    "Id. Hr: 10009  Cargo: 140  Rol: 1\n"
    "Rem c/ Aporte 1.000,00\n" + rule + "\n";
}

// Minimal statement with one employee and a given net payable figure.
inline std::string singleEmployeeStatement(const std::string& name, const std::string& net) {
  return
    "LIQUIDACION DE HABERES\n"
    "Id. Hr: 20001  Cargo: 1  Rol: 1\n"
    "Apellido y Nombre: " + name + "   Centro Pago: 1\n"
    "Liq. Pesos: " + net + "\n";
}
